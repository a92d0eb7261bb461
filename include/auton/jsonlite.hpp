#pragma once

// auton/jsonlite.hpp: Minimal strict JSON value model, parser and writer.
//
// DETERMINISM:
//   Objects are std::map, so to_json() always emits keys in sorted order.
//   Doubles are written with format_double() (6 decimals, trailing zeros
//   trimmed). encode(parse(x)) is therefore a canonical form of x.
//
// STRICTNESS:
//   Duplicate keys, NaN/Infinity, trailing data and unterminated strings are
//   errors. Nesting depth is bounded (kMaxDepth) so hostile input cannot
//   exhaust the stack. Non-negative integers are kept as uint64; negative
//   integers and fractions become double.
//
// WIRE SAFETY:
//   to_json() escapes every control byte below 0x20, so the output never
//   contains a raw newline. The NDJSON codec depends on this.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace auton::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(int i) {
    if (i >= 0) v = static_cast<std::uint64_t>(i);
    else v = static_cast<double>(i);
  }
  Value(long i) {
    if (i >= 0) v = static_cast<std::uint64_t>(i);
    else v = static_cast<double>(i);
  }
  Value(unsigned u) : v(static_cast<std::uint64_t>(u)) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
  std::size_t offset{0};
};

constexpr std::size_t kMaxDepth = 64;

// Parse any JSON value.
std::optional<Value> parse_value(std::string_view text, std::optional<JsonError>* error);

// Parse a JSON object. Returns an empty Object and sets *error on failure or
// when the top level is not an object.
Object parse(std::string_view text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(std::string_view text);
std::string canonicalize_json(std::string_view text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string escape(std::string_view s);
std::string format_double(double d);

// Type-safe extractors. A missing key or a value of the wrong type yields the
// default.
bool has_key(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def);
bool get_bool(const Object& obj, const std::string& key, bool def);
std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def);
std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def);
double get_double(const Object& obj, const std::string& key, double def);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

Array to_array(const std::vector<std::string>& items);
Object to_object(const std::map<std::string, std::string>& items);

}  // namespace auton::jsonlite
