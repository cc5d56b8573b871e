#include "jsonl_tally/record_classifier.hpp"

#include <simdjson.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace jt {

const char* kind_name(JsonKind k) noexcept {
  switch (k) {
    case JsonKind::Object:  return "object";
    case JsonKind::Array:   return "array";
    case JsonKind::String:  return "string";
    case JsonKind::Number:  return "number";
    case JsonKind::Boolean: return "boolean";
    case JsonKind::Null:    return "null";
    case JsonKind::Invalid: return "invalid";
  }
  return "invalid";
}

static JsonKind to_kind(simdjson::dom::element_type t) {
  switch (t) {
    case simdjson::dom::element_type::OBJECT:     return JsonKind::Object;
    case simdjson::dom::element_type::ARRAY:      return JsonKind::Array;
    case simdjson::dom::element_type::STRING:     return JsonKind::String;
    case simdjson::dom::element_type::INT64:
    case simdjson::dom::element_type::UINT64:
    case simdjson::dom::element_type::DOUBLE:     return JsonKind::Number;
    case simdjson::dom::element_type::BOOL:       return JsonKind::Boolean;
    case simdjson::dom::element_type::NULL_VALUE: return JsonKind::Null;
    default: break;
  }
  return JsonKind::Invalid;
}

// JSON number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
static bool is_number_token(std::string_view tok) {
  std::size_t i = 0;
  const std::size_t n = tok.size();
  auto digit = [&](std::size_t k) { return k < n && tok[k] >= '0' && tok[k] <= '9'; };
  if (i < n && tok[i] == '-') ++i;
  if (!digit(i)) return false;
  if (tok[i] == '0') ++i;
  else while (digit(i)) ++i;
  if (i < n && tok[i] == '.') {
    ++i;
    if (!digit(i)) return false;
    while (digit(i)) ++i;
  }
  if (i < n && (tok[i] == 'e' || tok[i] == 'E')) {
    ++i;
    if (i < n && (tok[i] == '+' || tok[i] == '-')) ++i;
    if (!digit(i)) return false;
    while (digit(i)) ++i;
  }
  return i == n;
}

static std::string_view trim_right(std::string_view s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                        s.back() == '\r' || s.back() == '\n'))
    s.remove_suffix(1);
  return s;
}

// Visits every value below v so structural errors anywhere in the line
// surface. Numbers are checked as raw tokens and never converted.
static simdjson::error_code walk_value(simdjson::ondemand::value& v) {
  using simdjson::ondemand::json_type;
  json_type t;
  if (auto e = v.type().get(t)) return e;
  switch (t) {
    case json_type::object: {
      simdjson::ondemand::object obj;
      if (auto e = v.get_object().get(obj)) return e;
      for (auto field_res : obj) {
        simdjson::ondemand::field field;
        if (auto e = std::move(field_res).get(field)) return e;
        std::string_view key;
        if (auto e = field.unescaped_key().get(key)) return e;
        if (auto e = walk_value(field.value())) return e;
      }
      return simdjson::SUCCESS;
    }
    case json_type::array: {
      simdjson::ondemand::array arr;
      if (auto e = v.get_array().get(arr)) return e;
      for (auto elem_res : arr) {
        simdjson::ondemand::value elem;
        if (auto e = elem_res.get(elem)) return e;
        if (auto e = walk_value(elem)) return e;
      }
      return simdjson::SUCCESS;
    }
    case json_type::string: {
      std::string_view s;
      return v.get_string().get(s);
    }
    case json_type::number:
      return is_number_token(trim_right(v.raw_json_token())) ? simdjson::SUCCESS
                                                             : simdjson::NUMBER_ERROR;
    case json_type::boolean: {
      bool b;
      return v.get_bool().get(b);
    }
    case json_type::null: {
      bool is_null = false;
      if (auto e = v.is_null().get(is_null)) return e;
      return is_null ? simdjson::SUCCESS : simdjson::N_ATOM_ERROR;
    }
    default:
      break;
  }
  return simdjson::TAPE_ERROR;
}

struct RecordClassifier::Impl {
  simdjson::dom::parser parser;
  simdjson::ondemand::parser od_parser;
  std::string scratch;    // line copy with simdjson padding
  std::string type_name;  // owns the name found by the fallback path

  // The DOM parser converts every number and fails on integers wider than
  // 64 bits. Such lines are still valid JSON, so they are re-read here with
  // the On-Demand API, which leaves numbers as tokens.
  Classification classify_wide_numbers(std::size_t len);
};

Classification RecordClassifier::Impl::classify_wide_numbers(std::size_t len) {
  Classification c;
  simdjson::padded_string_view json(scratch.data(), len, scratch.size());

  simdjson::ondemand::document doc;
  if (auto e = od_parser.iterate(json).get(doc)) {
    c.reason = simdjson::error_message(e);
    return c;
  }

  simdjson::ondemand::json_type t;
  if (auto e = doc.type().get(t)) {
    c.reason = simdjson::error_message(e);
    return c;
  }
  if (t != simdjson::ondemand::json_type::object) {
    // a bare number that overflows is still valid JSON, just not an object
    if (t == simdjson::ondemand::json_type::number) c.root = JsonKind::Number;
    else if (t == simdjson::ondemand::json_type::array) c.root = JsonKind::Array;
    c.reason = "not a JSON object";
    return c;
  }

  simdjson::ondemand::object obj;
  if (auto e = doc.get_object().get(obj)) {
    c.reason = simdjson::error_message(e);
    return c;
  }

  // the whole line is walked before any verdict, so a syntax error after a
  // duplicate "type" still reports the line as invalid JSON
  bool seen = false;
  bool duplicate = false;
  bool type_ok = false;
  for (auto field_res : obj) {
    simdjson::ondemand::field field;
    std::string_view key;
    if (auto e = std::move(field_res).get(field)) { c.reason = simdjson::error_message(e); return c; }
    if (auto e = field.unescaped_key().get(key)) { c.reason = simdjson::error_message(e); return c; }
    simdjson::ondemand::value& value = field.value();
    if (key == "type" && seen) {
      duplicate = true;
    } else if (key == "type") {
      seen = true;
      std::string_view name;
      simdjson::ondemand::json_type vt;
      if (auto e = value.type().get(vt)) { c.reason = simdjson::error_message(e); return c; }
      if (vt == simdjson::ondemand::json_type::string) {
        if (auto e = value.get_string().get(name)) { c.reason = simdjson::error_message(e); return c; }
        type_name.assign(name.data(), name.size());
        type_ok = true;
        continue;
      }
    }
    if (auto e = walk_value(value)) { c.reason = simdjson::error_message(e); return c; }
  }
  if (!doc.at_end()) {
    c.reason = "trailing content after JSON object";
    return c;
  }

  c.root = JsonKind::Object;
  if (duplicate) { c.reason = "duplicate \"type\" field"; return c; }
  if (!seen) { c.reason = "missing \"type\" field"; return c; }
  if (!type_ok) { c.reason = "\"type\" is not a string"; return c; }
  c.typed = true;
  c.type_name = type_name;
  return c;
}

RecordClassifier::RecordClassifier() : p_(new Impl{}) {}
RecordClassifier::~RecordClassifier() { delete p_; }

Classification RecordClassifier::classify(std::string_view line) {
  Classification c;

  auto& scratch = p_->scratch;
  scratch.assign(line.data(), line.size());
  scratch.resize(line.size() + simdjson::SIMDJSON_PADDING, '\0');

  simdjson::dom::element root;
  auto error = p_->parser.parse(scratch.data(), line.size(), false).get(root);
  if (error == simdjson::BIGINT_ERROR || error == simdjson::NUMBER_ERROR)
    return p_->classify_wide_numbers(line.size());
  if (error) {
    c.reason = simdjson::error_message(error);
    return c;
  }

  c.root = to_kind(root.type());
  if (c.root != JsonKind::Object) {
    c.reason = "not a JSON object";
    return c;
  }

  simdjson::dom::object obj;
  if (root.get_object().get(obj)) {
    c.reason = "not a JSON object";
    return c;
  }

  // Full scan of the keys: a repeated "type" is rejected rather than
  // silently taking the first one.
  bool seen = false;
  simdjson::dom::element type_value;
  for (simdjson::dom::key_value_pair field : obj) {
    if (field.key != "type") continue;
    if (seen) { c.reason = "duplicate \"type\" field"; return c; }
    seen = true;
    type_value = field.value;
  }
  if (!seen) {
    c.reason = "missing \"type\" field";
    return c;
  }

  std::string_view name;
  if (type_value.get_string().get(name)) {
    c.reason = "\"type\" is not a string";
    return c;
  }

  c.typed = true;
  c.type_name = name;
  return c;
}

}
