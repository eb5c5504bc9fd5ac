#include "sheet_table/token_jsonl_simdjson.hpp"
#include "sheet_table/address.hpp"
#include "sheet_table/date_parse.hpp"

#include <simdjson.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace st {

static std::string copy_capped(std::string_view s, size_t cap) {
  if (s.size() <= cap) return std::string(s);
  if (cap <= 3) return std::string(s.substr(0, cap));
  std::string out; out.reserve(cap);
  out.append(s.substr(0, cap - 3));
  out.append("...");
  return out;
}

static bool blank_line(std::string_view s) {
  for (char c : s) if (c != ' ' && c != '\t' && c != '\r') return false;
  return true;
}

// {"date": "YYYY-MM-DD"} or {"datetime": "YYYY-MM-DDTHH:MM:SS"}
static Cell tagged_cell(simdjson::ondemand::object obj) {
  for (auto field : obj) {
    std::string_view key = field.unescaped_key().value();
    std::string_view text = field.value().get_string().value();
    if (key == "date") {
      if (auto d = parse_iso_date(text)) return Date{*d};
      throw std::invalid_argument("bad date '" + std::string(text) + "'");
    }
    if (key == "datetime") {
      if (auto ms = parse_iso8601_ms(text)) return Timestamp{*ms};
      throw std::invalid_argument("bad datetime '" + std::string(text) + "'");
    }
    throw std::invalid_argument("unknown cell object key '" + std::string(key) + "'");
  }
  return Cell{};
}

static Cell to_cell(simdjson::ondemand::value v, size_t cap) {
  switch (v.type()) {
    case simdjson::ondemand::json_type::number:
      return double(v.get_double());
    case simdjson::ondemand::json_type::string:
      return std::string(v.get_string().value());
    case simdjson::ondemand::json_type::boolean:
      return bool(v.get_bool());
    case simdjson::ondemand::json_type::null:
      return Cell{};
    case simdjson::ondemand::json_type::object:
      return tagged_cell(v.get_object());
    default: {
      // nested arrays: keep their JSON text
      std::string_view raw = v.raw_json().value();
      return copy_capped(raw, cap);
    }
  }
}

struct JsonlSheetTokenizer::Impl {
  JsonlConfig cfg;
  simdjson::ondemand::parser parser;
  std::string scratch;
  Row row;
  MergeRegion merge;

  explicit Impl(const JsonlConfig& c) : cfg(c) {}

  void read_merge(simdjson::ondemand::value m) {
    if (m.type() == simdjson::ondemand::json_type::string) {
      merge = parse_range(m.get_string().value());
      return;
    }
    // [row_lo, row_hi, col_lo, col_hi], zero-based, high bounds exclusive
    std::size_t v[4];
    std::size_t n = 0;
    for (auto e : m.get_array()) {
      if (n == 4) throw std::invalid_argument("merge array needs 4 numbers");
      v[n++] = static_cast<std::size_t>(e.get_uint64().value());
    }
    if (n != 4) throw std::invalid_argument("merge array needs 4 numbers");
    if (v[0] >= v[1] || v[2] >= v[3]) throw std::invalid_argument("empty merge region");
    merge = MergeRegion{v[0], v[1], v[2], v[3]};
  }
};

JsonlSheetTokenizer::JsonlSheetTokenizer(const JsonlConfig& cfg)
  : p_(new Impl(cfg)) {}

JsonlSheetTokenizer::~JsonlSheetTokenizer() { delete p_; }

const Row& JsonlSheetTokenizer::row() const { return p_->row; }
const MergeRegion& JsonlSheetTokenizer::merge() const { return p_->merge; }

bool JsonlSheetTokenizer::feed_line(std::string_view line, LineKind* kind) {
  *kind = LineKind::Skip;
  if (blank_line(line)) return true;

  p_->scratch.assign(line.data(), line.size());
  p_->scratch.resize(line.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(p_->scratch.data(), line.size(), p_->scratch.size());

  try {
    simdjson::ondemand::document doc = p_->parser.iterate(view);
    auto root = doc.get_value();
    auto t    = root.type().value();
    LineKind found = LineKind::Skip;

    if (t == simdjson::ondemand::json_type::array) {
      p_->row.clear();
      for (auto elem : root.get_array()) {
        p_->row.push_back(to_cell(elem.value(), p_->cfg.cap_nested_value_bytes));
      }
      found = LineKind::Row;
    } else if (t == simdjson::ondemand::json_type::object) {
      // walk every field so trailing content is reached
      for (auto field : root.get_object()) {
        if (field.unescaped_key().value() == "merge" && found == LineKind::Skip) {
          p_->read_merge(field.value());
          found = LineKind::Merge;
        }
      }
    }

    if (found != LineKind::Skip) {
      if (!doc.at_end()) {
        err_ = "JSONL: trailing content after the line's JSON value";
        return false;
      }
      *kind = found;
      return true;
    }

    if (p_->cfg.strict) {
      err_ = "JSONL strict mode: line is neither a row array nor a merge object";
      return false;
    }
    return true;

  } catch (const std::exception& e) {
    err_ = e.what();
    return false;
  }
}

}
