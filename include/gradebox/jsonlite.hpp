#pragma once

// gradebox/jsonlite.hpp — Minimal JSON value model, strict parser and
// deterministic writer used by the wire protocol, the marker payload and the
// CLI.
//
// DETERMINISM:
//   - Object is a std::map, so to_json() always emits keys in sorted order.
//   - Doubles are written in shortest round-trip form (std::to_chars).
//   - Integers that fit in int64 stay integers; larger ones fall back to double.

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gradebox::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : v(b) {}
  Value(int i) : v(static_cast<std::int64_t>(i)) {}
  Value(std::int64_t i) : v(i) {}
  Value(std::uint64_t u) {
    if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      v = static_cast<std::int64_t>(u);
    } else {
      v = static_cast<double>(u);
    }
  }
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_bool() const { return std::holds_alternative<bool>(v); }
  bool is_int() const { return std::holds_alternative<std::int64_t>(v); }
  bool is_double() const { return std::holds_alternative<double>(v); }
  bool is_number() const { return is_int() || is_double(); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }

  bool as_bool() const { return std::get<bool>(v); }
  std::int64_t as_int() const { return std::get<std::int64_t>(v); }
  double as_double() const {
    return is_int() ? static_cast<double>(std::get<std::int64_t>(v)) : std::get<double>(v);
  }
  const std::string& as_string() const { return std::get<std::string>(v); }
  const Array& as_array() const { return std::get<Array>(v); }
  const Object& as_object() const { return std::get<Object>(v); }
  Array& as_array() { return std::get<Array>(v); }
  Object& as_object() { return std::get<Object>(v); }

  bool operator==(const Value& other) const { return v == other.v; }
  bool operator!=(const Value& other) const { return !(*this == other); }
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse any JSON document. On error returns null and fills *error.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON document whose root must be an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. A missing key or a type mismatch yields the default.
const Value* find(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);

}  // namespace gradebox::jsonlite
