#include "concord/jsonlite.hpp"

// CANONICAL OUTPUT:
//   to_json() walks std::map objects, so keys come out sorted, with no
//   whitespace. envelope_digest() depends on it: an envelope serializes to the
//   same bytes however its keys were ordered on input.
//   Doubles are printed "%.6f" with trailing zeros trimmed. No envelope field
//   is floating point; doubles only show up in opaque extensions.
//
// STRICTNESS:
//   - Duplicate object keys fail with json_duplicate_key.
//   - Anything after the top-level value fails with "trailing data".
//   - A line cut off by a crash fails with "unexpected eof" or
//     "unterminated string". The queue store skips such lines on that basis.

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace concord::jsonlite {

namespace {

void put_utf8(std::string& out, uint32_t cp) {
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

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

class Reader {
 public:
  explicit Reader(std::string_view text) : text_(text) {}

  // Parse exactly one document.
  Value document() {
    Value v = value();
    skip_ws();
    if (!error_ && pos_ != text_.size()) fail("trailing data");
    return v;
  }

  const std::optional<JsonError>& error() const { return error_; }

 private:
  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return text_[pos_]; }

  void skip_ws() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) ++pos_;
  }

  bool consume(char c) {
    skip_ws();
    if (at_end() || peek() != c) return false;
    ++pos_;
    return true;
  }

  bool literal(std::string_view word) {
    if (text_.substr(pos_, word.size()) != word) return false;
    pos_ += word.size();
    return true;
  }

  void fail(std::string message, std::string code = "json_parse_error") {
    if (!error_) error_ = JsonError{std::move(code), std::move(message)};
  }

  Value value() {
    skip_ws();
    if (at_end()) {
      fail("unexpected eof");
      return {};
    }
    switch (peek()) {
      case '{': return Value{object()};
      case '[': return Value{array()};
      case '"': return Value{string()};
      default: break;
    }
    if (literal("true")) return Value{true};
    if (literal("false")) return Value{false};
    if (literal("null")) return Value{nullptr};
    return number();
  }

  // Four hex digits after "\u".
  std::optional<uint32_t> code_unit() {
    if (pos_ + 4 > text_.size()) return std::nullopt;
    uint32_t cp = 0;
    for (int k = 0; k < 4; ++k) {
      const int d = hex_digit(text_[pos_++]);
      if (d < 0) {
        fail("invalid unicode escape");
        return std::nullopt;
      }
      cp = (cp << 4) | static_cast<uint32_t>(d);
    }
    return cp;
  }

  std::string string() {
    if (!consume('"')) {
      fail("expected string");
      return {};
    }
    std::string out;
    while (!at_end()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (c != '\\') {
        out += c;
        continue;
      }
      if (at_end()) break;
      const char esc = text_[pos_++];
      switch (esc) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'u': {
          auto cp = code_unit();
          if (!cp) {
            if (!error_) fail("unterminated string");
            return {};
          }
          // High surrogate followed by "\uDC00".."\uDFFF" forms one code point.
          if (*cp >= 0xD800 && *cp <= 0xDBFF && text_.substr(pos_, 2) == "\\u") {
            const size_t mark = pos_;
            pos_ += 2;
            const auto low = code_unit();
            if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
              *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
            } else if (error_) {
              return {};
            } else {
              pos_ = mark;
            }
          }
          put_utf8(out, *cp);
          break;
        }
        default: out += esc; break;   // \" \\ \/
      }
    }
    fail("unterminated string");
    return {};
  }

  Value number() {
    if (text_.substr(pos_, 3) == "NaN" || text_.substr(pos_, 8) == "Infinity" ||
        text_.substr(pos_, 9) == "-Infinity") {
      fail("NaN/Infinity unsupported");
      return {};
    }
    const size_t start = pos_;
    if (!at_end() && peek() == '-') ++pos_;
    if (at_end() || !is_digit(peek())) {
      fail(at_end() ? "unexpected eof" : "unexpected token");
      return {};
    }
    while (!at_end() && is_digit(peek())) ++pos_;

    bool integral = text_[start] != '-';
    if (!at_end() && peek() == '.') {
      integral = false;
      ++pos_;
      if (at_end() || !is_digit(peek())) {
        fail("invalid number format");
        return {};
      }
      while (!at_end() && is_digit(peek())) ++pos_;
    }
    if (!at_end() && (peek() == 'e' || peek() == 'E')) {
      integral = false;
      ++pos_;
      if (!at_end() && (peek() == '+' || peek() == '-')) ++pos_;
      if (at_end() || !is_digit(peek())) {
        fail("invalid exponent");
        return {};
      }
      while (!at_end() && is_digit(peek())) ++pos_;
    }

    const std::string_view digits = text_.substr(start, pos_ - start);
    if (integral) {
      std::uint64_t n = 0;
      const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), n);
      if (ec != std::errc() || end != digits.data() + digits.size()) {
        fail("number out of range");
        return {};
      }
      return Value{n};
    }
    const std::string copy(digits);
    char* end = nullptr;
    const double d = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size()) {
      fail("invalid number format");
      return {};
    }
    return Value{d};
  }

  Object object() {
    Object out;
    consume('{');
    if (consume('}')) return out;
    while (!error_) {
      std::string key = string();
      if (error_) break;
      if (out.contains(key)) {
        fail("duplicate key: " + key, "json_duplicate_key");
        break;
      }
      if (!consume(':')) {
        fail(at_end() ? "unexpected eof" : "expected :");
        break;
      }
      Value v = value();
      if (error_) break;
      out.emplace(std::move(key), std::move(v));
      if (consume('}')) break;
      if (!consume(',')) fail(at_end() ? "unexpected eof" : "expected ,");
    }
    return out;
  }

  Array array() {
    Array out;
    consume('[');
    if (consume(']')) return out;
    while (!error_) {
      out.push_back(value());
      if (error_) break;
      if (consume(']')) break;
      if (!consume(',')) fail(at_end() ? "unexpected eof" : "expected ,");
    }
    return out;
  }

  std::string_view text_;
  size_t pos_{0};
  std::optional<JsonError> error_;
};

void write_string(std::string& out, const std::string& s) {
  out += '"';
  for (char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += '"';
}

void write_double(std::string& out, double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) {
    out += "0.0";
    return;
  }
  std::string s(buf, static_cast<size_t>(n));
  while (s.back() == '0') s.pop_back();
  if (s.back() == '.') s += '0';
  out += s;
}

void write_value(std::string& out, const Value& v);

void write_object(std::string& out, const Object& obj) {
  out += '{';
  bool first = true;
  for (const auto& [key, value] : obj) {
    if (!first) out += ',';
    first = false;
    write_string(out, key);
    out += ':';
    write_value(out, value);
  }
  out += '}';
}

void write_value(std::string& out, const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) {
    out += "null";
  } else if (const auto* b = std::get_if<bool>(&v.v)) {
    out += *b ? "true" : "false";
  } else if (const auto* n = std::get_if<std::uint64_t>(&v.v)) {
    out += std::to_string(*n);
  } else if (const auto* d = std::get_if<double>(&v.v)) {
    write_double(out, *d);
  } else if (const auto* s = std::get_if<std::string>(&v.v)) {
    write_string(out, *s);
  } else if (const auto* o = std::get_if<Object>(&v.v)) {
    write_object(out, *o);
  } else {
    out += '[';
    bool first = true;
    for (const auto& item : std::get<Array>(v.v)) {
      if (!first) out += ',';
      first = false;
      write_value(out, item);
    }
    out += ']';
  }
}

// Member of the requested alternative, or nullptr.
template <typename T>
const T* member(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : std::get_if<T>(&it->second.v);
}

}  // namespace

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Reader r(text);
  Value v = r.document();
  if (error) *error = r.error();
  return r.error() ? Value{} : v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = parse_value(text, &err);
  if (!err && !std::holds_alternative<Object>(v.v)) {
    err = JsonError{"json_parse_error", "expected object"};
  }
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::string to_json(const Value& value) {
  std::string out;
  write_value(out, value);
  return out;
}

std::string to_json(const Object& object) {
  std::string out;
  write_object(out, object);
  return out;
}

std::string escape(const std::string& s) {
  std::string quoted;
  quoted.reserve(s.size() + 2);
  write_string(quoted, s);
  return quoted.substr(1, quoted.size() - 2);
}

bool has_key(const Object& obj, const std::string& key) { return obj.contains(key); }

bool is_null(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() || std::holds_alternative<std::nullptr_t>(it->second.v);
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = member<std::string>(obj, key);
  return s ? *s : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* n = member<std::uint64_t>(obj, key);
  return n ? *n : def;
}

std::optional<Object> get_object(const Object& obj, const std::string& key) {
  const auto* o = member<Object>(obj, key);
  if (!o) return std::nullopt;
  return *o;
}

std::optional<Array> get_array(const Object& obj, const std::string& key) {
  const auto* a = member<Array>(obj, key);
  if (!a) return std::nullopt;
  return *a;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  const auto* a = member<Array>(obj, key);
  if (!a) return out;
  for (const auto& item : *a) {
    if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
  }
  return out;
}

}  // namespace concord::jsonlite
