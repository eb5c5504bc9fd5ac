#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace st {

enum class ErrorKind {
  MalformedAddress,      // address/literal matches no known notation
  InvalidConfig,         // scan configuration violates its invariants
  UnresolvableBoundary,  // stop condition could not be evaluated
  ShapeMismatch,         // named record shape cannot hold the row
};

std::string_view to_string(ErrorKind k) noexcept;

class ScanError : public std::runtime_error {
public:
  ScanError(ErrorKind kind, const std::string& msg)
      : std::runtime_error(std::string(to_string(kind)) + ": " + msg), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

}
