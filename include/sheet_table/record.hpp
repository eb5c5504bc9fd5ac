#pragma once
#include "sheet_table/cell.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace st {

using FieldNames = std::vector<std::string>;

// Ordered field name -> value mapping. Names are shared by every record of
// a scan.
class FieldMap {
public:
  FieldMap() = default;
  FieldMap(std::shared_ptr<const FieldNames> names, Row values)
      : names_(std::move(names)), values_(std::move(values)) {}

  std::size_t size() const noexcept { return values_.size(); }
  const std::string& name(std::size_t i) const { return (*names_)[i]; }
  const Cell& value(std::size_t i) const { return values_[i]; }
  const Row& values() const noexcept { return values_; }

  // nullptr if `name` is not a field.
  const Cell* find(std::string_view name) const noexcept;
  // Throws std::out_of_range.
  const Cell& at(std::string_view name) const;

private:
  std::shared_ptr<const FieldNames> names_;
  Row values_;
};

// Member layout of NamedRecord, derived once from the field names.
class RecordSchema {
public:
  // Throws ScanError(ShapeMismatch) if a name cannot become a unique member.
  static std::shared_ptr<const RecordSchema> from_fieldnames(const FieldNames& names);

  const std::vector<std::string>& members() const noexcept { return members_; }
  std::size_t size() const noexcept { return members_.size(); }
  // npos if absent.
  std::size_t index_of(std::string_view member) const noexcept;

  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

private:
  std::vector<std::string> members_;
  std::unordered_map<std::string, std::size_t> index_;
};

// Field name -> member name: non-word characters become '_', a leading
// digit gets a '_' prefix. Empty result means no member can be derived.
std::string member_name(std::string_view field);

// Fixed-shape record; values addressed by member name or position.
class NamedRecord {
public:
  NamedRecord() = default;
  // Throws ScanError(ShapeMismatch) when values.size() != schema->size().
  NamedRecord(std::shared_ptr<const RecordSchema> schema, Row values);

  std::size_t size() const noexcept { return values_.size(); }
  const Cell& operator[](std::size_t i) const { return values_[i]; }
  const Row& values() const noexcept { return values_; }
  const RecordSchema& schema() const noexcept { return *schema_; }

  // Throws std::out_of_range for an unknown member.
  const Cell& get(std::string_view member) const;

private:
  std::shared_ptr<const RecordSchema> schema_;
  Row values_;
};

using Record = std::variant<FieldMap, NamedRecord>;

enum class RecordShape { Map, Named };

class RecordBuilder {
public:
  virtual ~RecordBuilder() = default;
  virtual Record build(Row values) const = 0;
};

// Picks the builder for `shape`; the named schema is computed here, once.
std::unique_ptr<RecordBuilder> make_record_builder(RecordShape shape,
                                                   std::shared_ptr<const FieldNames> names);

// Positional values of either record shape.
const Row& record_values(const Record& r) noexcept;

}
