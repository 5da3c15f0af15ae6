#include "dgate/jsonlite.hpp"

// DETERMINISM GUARANTEES:
//   - to_json() iterates std::map, so object keys are emitted sorted.
//   - Numbers are re-emitted from their validated literal text. No locale and
//     no floating point formatting is involved anywhere in this file.
//
// HARDENING:
//   - Nesting is bounded by kMaxNestingDepth; deeper input is a parse error,
//     never a stack overflow.
//   - \uXXXX escapes are decoded to UTF-8; lone surrogates are rejected.

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>

namespace dgate::jsonlite {

namespace {

void append_utf8(std::string& o, uint32_t cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  size_t depth{0};
  std::optional<JsonError> err;

  void fail(const char* code, std::string message) {
    if (!err) err = JsonError{code, std::move(message)};
  }

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool read_hex4(uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (size_t k = 0; k < 4; ++k) {
      const char c = s[i + k];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
      else return false;
    }
    i += 4;
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { fail("json_parse_error", "expected string"); return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("json_parse_error", "unescaped control character in string");
        return {};
      }
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      switch (n) {
        case '"': o += '"'; break;
        case '\\': o += '\\'; break;
        case '/': o += '/'; break;
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case 'u': {
          uint32_t cp = 0;
          if (!read_hex4(cp)) { fail("json_parse_error", "invalid \\u escape"); return {}; }
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            uint32_t lo = 0;
            if (i + 1 >= s.size() || s[i] != '\\' || s[i + 1] != 'u') {
              fail("json_parse_error", "unpaired surrogate");
              return {};
            }
            i += 2;
            if (!read_hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
              fail("json_parse_error", "unpaired surrogate");
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("json_parse_error", "unpaired surrogate");
            return {};
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
    const size_t start = i;
    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 ||
        s.compare(i, 9, "-Infinity") == 0) {
      fail("json_parse_error", "NaN/Infinity unsupported");
      return false;
    }
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    if (s[i] == '0' && i + 1 < s.size() && std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
      fail("json_parse_error", "leading zero in number");
      return false;
    }
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i < s.size() && s[i] == '.') {
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("json_parse_error", "invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("json_parse_error", "invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    out_val = Value{Number{s.substr(start, i - start)}};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { fail("json_parse_error", "unexpected eof"); return {}; }
    if (s[i] == '{' || s[i] == '[') {
      if (++depth > kMaxNestingDepth) {
        fail("json_parse_error", "nesting too deep");
        return {};
      }
      Value out = s[i] == '{' ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return out;
    }
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

  std::optional<Value> run() {
    Value v = parse_value();
    ws();
    if (!err && i != s.size()) fail("json_parse_error", "trailing data");
    if (err) return std::nullopt;
    return v;
  }
};

std::string escape_inner(const std::string& s) {
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
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      static constexpr char kHex[] = "0123456789abcdef";
      o += "\\u00";
      o += kHex[(c >> 4) & 0x0f];
      o += kHex[c & 0x0f];
    } else {
      o += c;
    }
  }
  return o;
}

}  // namespace

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape_inner(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<Number>(v.v)) return std::get<Number>(v.v).text;
  if (std::holds_alternative<Object>(v.v)) {
    std::ostringstream oss; oss << "{"; bool first = true;
    for (const auto& [k, vv] : std::get<Object>(v.v)) { if (!first) oss << ","; first = false; oss << "\"" << escape_inner(k) << "\"" << ":" << to_json(vv); }
    oss << "}"; return oss.str();
  }
  std::ostringstream oss; oss << "["; bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) { if (!first) oss << ","; first = false; oss << to_json(vv); }
  oss << "]"; return oss.str();
}

std::size_t nesting_depth(const Value& v) {
  std::size_t inner = 0;
  if (const auto* arr = std::get_if<Array>(&v.v)) {
    for (const auto& item : *arr) inner = std::max(inner, nesting_depth(item));
    return inner + 1;
  }
  if (const auto* obj = std::get_if<Object>(&v.v)) {
    for (const auto& [key, item] : *obj) {
      (void)key;
      inner = std::max(inner, nesting_depth(item));
    }
    return inner + 1;
  }
  return 0;
}

std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.run();
  if (error) *error = p.err;
  return v;
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Parser p{text};
  (void)p.run();
  return p.err;
}

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.run();
  if (error) *error = p.err;
  if (!v) return {};
  return to_json(*v);
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.run();
  if (v && !v->is_object()) p.fail("json_parse_error", "top-level value must be an object");
  if (error) *error = p.err;
  if (p.err) return {};
  return std::get<Object>(v->v);
}

bool is_number_literal(const std::string& text) {
  if (text.empty() || std::isspace(static_cast<unsigned char>(text[0]))) return false;
  Parser p{text};
  Value out;
  if (!p.parse_number(out)) return false;
  return !p.err && p.i == text.size();
}

Value number(unsigned long long n) { return Value{Number{std::to_string(n)}}; }

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}

unsigned long long get_u64(const Object& obj, const std::string& key,
                           unsigned long long def, bool* ok) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  const auto* num = std::get_if<Number>(&it->second.v);
  bool valid = num && !num->text.empty() && num->text.size() <= 20;
  unsigned long long out = 0;
  if (valid) {
    for (char c : num->text) {
      if (c < '0' || c > '9') { valid = false; break; }
      const unsigned long long digit = static_cast<unsigned long long>(c - '0');
      if (out > (~0ULL - digit) / 10) { valid = false; break; }
      out = out * 10 + digit;
    }
  }
  if (!valid) {
    if (ok) *ok = false;
    return def;
  }
  return out;
}

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

std::string escape(const std::string& s) { return escape_inner(s); }

}  // namespace dgate::jsonlite
