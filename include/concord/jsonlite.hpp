#pragma once

// concord/jsonlite.hpp — Minimal strict JSON reader/writer.
//
// Objects are std::map-backed, so to_json() always emits keys in sorted order.
// That makes to_json(parse_value(x)) a canonical form: the queue integrity
// digest is computed over it.
//
// Numbers: non-negative integers are held as uint64_t; negative integers,
// fractions and exponents as double. NaN/Infinity are rejected.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace concord::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Parse any JSON document. On failure *error is set and a null Value returned.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON document that must be an object. Returns {} on failure or
// when the document is not an object (and sets *error in the latter case).
Object parse(const std::string& text, std::optional<JsonError>* error);

// Serialize compactly (no whitespace, sorted keys).
std::string to_json(const Value& value);
std::string to_json(const Object& object);

// Escape a string for embedding between double quotes.
std::string escape(const std::string& s);

// Type-safe extractors. Missing key or wrong type → default.
bool has_key(const Object& obj, const std::string& key);
bool is_null(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::optional<Object> get_object(const Object& obj, const std::string& key);
std::optional<Array> get_array(const Object& obj, const std::string& key);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

}  // namespace concord::jsonlite
