#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace st {

struct CsvConfig {
  char delimiter = ',';
  char quote     = '"';
};

// One parsed CSV field; `quoted` tells the typing step to keep it as text.
struct CsvField {
  std::string text;
  bool quoted = false;
};

// Line-fed CSV state machine. A quoted field may span lines: feed() then
// returns true without a record and waits for the next line.
class CsvFsm {
public:
  explicit CsvFsm(const CsvConfig& cfg);
  ~CsvFsm();

  CsvFsm(const CsvFsm&) = delete;
  CsvFsm& operator=(const CsvFsm&) = delete;

  // Returns false on malformed quoting. When a record is complete,
  // `*complete` is set and fields() holds it until the next feed().
  bool feed(std::string_view line, bool* complete);

  // False if input ended inside a quoted field.
  bool finish();

  const std::vector<CsvField>& fields() const;
  const std::string& error() const { return err_; }
  std::uint64_t records() const { return records_; }

private:
  struct Impl; Impl* p_;
  std::uint64_t records_{0};
  std::string err_;
};

}
