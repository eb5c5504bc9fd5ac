#include "sheet_table/record.hpp"
#include "sheet_table/scan_error.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace st {

const Cell* FieldMap::find(std::string_view name) const noexcept {
  if (!names_) return nullptr;
  for (std::size_t i = 0; i < names_->size() && i < values_.size(); ++i)
    if ((*names_)[i] == name) return &values_[i];
  return nullptr;
}

const Cell& FieldMap::at(std::string_view name) const {
  if (const Cell* c = find(name)) return *c;
  throw std::out_of_range("no field '" + std::string(name) + "'");
}

std::string member_name(std::string_view field) {
  std::string out;
  out.reserve(field.size() + 1);
  for (char ch : field) {
    const unsigned char c = static_cast<unsigned char>(ch);
    const bool word = c >= 0x80 || c == '_' ||
                      (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    out.push_back(word ? ch : '_');
  }
  if (!out.empty() && out[0] >= '0' && out[0] <= '9') out.insert(out.begin(), '_');
  return out;
}

std::shared_ptr<const RecordSchema> RecordSchema::from_fieldnames(const FieldNames& names) {
  auto schema = std::make_shared<RecordSchema>();
  schema->members_.reserve(names.size());
  for (std::size_t i = 0; i < names.size(); ++i) {
    std::string m = member_name(names[i]);
    if (m.empty())
      throw ScanError(ErrorKind::ShapeMismatch,
                      "field " + std::to_string(i + 1) + " has no usable member name");
    auto [it, fresh] = schema->index_.emplace(m, i);
    if (!fresh)
      throw ScanError(ErrorKind::ShapeMismatch,
                      "fields '" + names[it->second] + "' and '" + names[i] +
                      "' both map to member '" + m + "'");
    schema->members_.push_back(std::move(m));
  }
  return schema;
}

std::size_t RecordSchema::index_of(std::string_view member) const noexcept {
  auto it = index_.find(std::string(member));
  return it == index_.end() ? npos : it->second;
}

NamedRecord::NamedRecord(std::shared_ptr<const RecordSchema> schema, Row values)
  : schema_(std::move(schema)), values_(std::move(values)) {
  if (!schema_)
    throw ScanError(ErrorKind::ShapeMismatch, "record without schema");
  if (values_.size() != schema_->size())
    throw ScanError(ErrorKind::ShapeMismatch,
                    "row has " + std::to_string(values_.size()) + " values, record has " +
                    std::to_string(schema_->size()) + " members");
}

const Cell& NamedRecord::get(std::string_view member) const {
  const std::size_t i = schema_ ? schema_->index_of(member) : RecordSchema::npos;
  if (i == RecordSchema::npos) throw std::out_of_range("no member '" + std::string(member) + "'");
  return values_[i];
}

namespace {

class FieldMapBuilder final : public RecordBuilder {
public:
  explicit FieldMapBuilder(std::shared_ptr<const FieldNames> names) : names_(std::move(names)) {}
  Record build(Row values) const override { return FieldMap(names_, std::move(values)); }

private:
  std::shared_ptr<const FieldNames> names_;
};

class NamedRecordBuilder final : public RecordBuilder {
public:
  explicit NamedRecordBuilder(const FieldNames& names)
    : schema_(RecordSchema::from_fieldnames(names)) {}
  Record build(Row values) const override { return NamedRecord(schema_, std::move(values)); }

private:
  std::shared_ptr<const RecordSchema> schema_;
};

}

std::unique_ptr<RecordBuilder> make_record_builder(RecordShape shape,
                                                   std::shared_ptr<const FieldNames> names) {
  if (shape == RecordShape::Named) return std::make_unique<NamedRecordBuilder>(*names);
  return std::make_unique<FieldMapBuilder>(std::move(names));
}

const Row& record_values(const Record& r) noexcept {
  if (const FieldMap* m = std::get_if<FieldMap>(&r)) return m->values();
  return std::get_if<NamedRecord>(&r)->values();
}

}
