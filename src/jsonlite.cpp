#include "gradebox/jsonlite.hpp"

// Notes on jsonlite:
//
//   - The parser is strict: trailing data, duplicate keys, NaN/Infinity and
//     unterminated strings are errors. Guest payloads and wire frames both go
//     through here, so a malformed document must never be half-accepted.
//   - \uXXXX escapes (including surrogate pairs) decode to UTF-8; the writer
//     escapes control characters as \u00XX and passes other bytes through.
//   - Depth is capped at kMaxDepth to keep recursion bounded on hostile input.

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdint>
#include <map>
#include <sstream>
#include <system_error>
#include <variant>

namespace gradebox::jsonlite {

namespace {

constexpr int kMaxDepth = 256;

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  int depth{0};
  std::optional<JsonError> err;

  void fail(const char* code, const std::string& msg) {
    if (!err) err = JsonError{code, msg};
  }

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool read_hex4(std::uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<std::uint32_t>(c - 'A' + 10);
      else return false;
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { fail("json_parse_error", "expected string"); return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      switch (n) {
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case '/': o += '/'; break;
        case '\\': o += '\\'; break;
        case '"': o += '"'; break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!read_hex4(cp)) { fail("json_parse_error", "invalid \\u escape"); return {}; }
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            i += 2;
            std::uint32_t lo = 0;
            if (!read_hex4(lo)) { fail("json_parse_error", "invalid \\u escape"); return {}; }
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
              cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
            } else {
              append_utf8(o, 0xFFFD);
              cp = lo;
            }
          }
          append_utf8(o, cp);
          break;
        }
        default:
          fail("json_parse_error", "invalid escape");
          return {};
      }
    }
    fail("json_parse_error", "unterminated string");
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    size_t start = i;
    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      fail("json_parse_error", "NaN/Infinity unsupported");
      return false;
    }
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool is_real = false;
    if (i < s.size() && s[i] == '.') {
      is_real = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("json_parse_error", "invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_real = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("json_parse_error", "invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const char* first = s.data() + start;
    const char* last = s.data() + i;
    if (!is_real) {
      std::int64_t iv = 0;
      auto [p, ec] = std::from_chars(first, last, iv);
      if (ec == std::errc() && p == last) {
        out_val = Value{iv};
        return true;
      }
    }
    double d = 0.0;
    auto [p, ec] = std::from_chars(first, last, d);
    if (ec != std::errc() || p != last) {
      fail("json_parse_error", "invalid number");
      return false;
    }
    out_val = Value{d};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { fail("json_parse_error", "unexpected eof"); return {}; }
    if (depth > kMaxDepth) { fail("json_parse_error", "nesting too deep"); return {}; }
    if (s[i] == '{') { ++depth; Value v{parse_object()}; --depth; return v; }
    if (s[i] == '[') { ++depth; Value v{parse_array()}; --depth; return v; }
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) return num_val;
    fail("json_parse_error", "unexpected token");
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { fail("json_duplicate_key", "duplicate key: " + k); break; }
      if (!eat(':')) { fail("json_parse_error", "expected :"); break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { fail("json_parse_error", "expected ,"); break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { fail("json_parse_error", "expected ,"); break; }
    }
    return out;
  }

  Value parse_document() {
    Value v = parse_value();
    ws();
    if (!err && i != s.size()) fail("json_parse_error", "trailing data");
    return err ? Value{} : v;
  }
};

void write(std::string& out, const Value& v) {
  if (v.is_null()) { out += "null"; return; }
  if (v.is_bool()) { out += v.as_bool() ? "true" : "false"; return; }
  if (v.is_int()) { out += std::to_string(v.as_int()); return; }
  if (v.is_double()) { out += format_double(std::get<double>(v.v)); return; }
  if (v.is_string()) { out += '"'; out += escape(v.as_string()); out += '"'; return; }
  if (v.is_array()) {
    out += '[';
    bool first = true;
    for (const auto& item : v.as_array()) {
      if (!first) out += ',';
      first = false;
      write(out, item);
    }
    out += ']';
    return;
  }
  out += '{';
  bool first = true;
  for (const auto& [k, item] : v.as_object()) {
    if (!first) out += ',';
    first = false;
    out += '"';
    out += escape(k);
    out += "\":";
    write(out, item);
  }
  out += '}';
}

}  // namespace

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_document();
  if (error) *error = p.err;
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_document();
  if (!p.err && !v.is_object()) p.err = JsonError{"json_parse_error", "root is not an object"};
  if (error) *error = p.err;
  if (p.err) return {};
  return std::move(v.as_object());
}

std::string to_json(const Value& v) {
  std::string out;
  write(out, v);
  return out;
}

// Fast path: most strings (identifiers, ids, short values) need no escaping.
std::string escape(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    switch (c) {
      case '"': o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o += buf;
        } else {
          o += c;
        }
    }
  }
  return o;
}

std::string format_double(double d) {
  if (!std::isfinite(d)) return "null";
  char buf[64];
  auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), d);
  if (ec != std::errc()) return "0.0";
  std::string result(buf, p);
  // Keep the value recognisably real so a round trip does not turn 2.0 into 2.
  if (result.find_first_of(".eE") == std::string::npos) result += ".0";
  return result;
}

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const Value* v = find(obj, key);
  return (v && v->is_string()) ? v->as_string() : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const Value* v = find(obj, key);
  return (v && v->is_bool()) ? v->as_bool() : def;
}

std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def) {
  const Value* v = find(obj, key);
  if (!v || !v->is_int() || v->as_int() < 0) return def;
  return static_cast<std::uint64_t>(v->as_int());
}

double get_double(const Object& obj, const std::string& key, double def) {
  const Value* v = find(obj, key);
  return (v && v->is_number()) ? v->as_double() : def;
}

}  // namespace gradebox::jsonlite
