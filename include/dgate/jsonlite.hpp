#pragma once

// dgate/jsonlite.hpp — Strict JSON parser and canonical serializer.
//
// Numbers are carried as their literal text and are never routed through
// binary floating point. Consumers that need numeric semantics build an exact
// Decimal from Number::text (see decimal.hpp).
//
// Canonical form: object keys sorted (std::map iteration), no insignificant
// whitespace, control characters escaped. canonicalize_json() is idempotent.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dgate::jsonlite {

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

struct Number {
  std::string text;  // validated JSON number literal
  bool operator==(const Number& o) const { return text == o.text; }
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, Number, std::string, Array, Object> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(Number n) : v(std::move(n)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
};

// Maximum container nesting accepted by the parser.
constexpr std::size_t kMaxNestingDepth = 256;

// Parse any JSON value. On failure returns nullopt and fills *error.
std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON document whose top level must be an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);
std::string to_json(const Value& v);

// Container levels in v: 0 for a scalar, 1 for [] or {}, 2 for [[1]].
std::size_t nesting_depth(const Value& v);

// Number literal helpers.
bool is_number_literal(const std::string& text);
Value number(unsigned long long n);

// Type-safe extractors
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
// Non-negative integer field. Returns def when absent; sets *ok=false when the
// field is present but is not an unsigned integer literal that fits in 64 bits.
unsigned long long get_u64(const Object& obj, const std::string& key,
                           unsigned long long def = 0, bool* ok = nullptr);
const Value* find(const Object& obj, const std::string& key);

std::string escape(const std::string& s);

}  // namespace dgate::jsonlite
