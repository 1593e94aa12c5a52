#include "scratchpad/jsonlite.hpp"

// jsonlite carries config files, dependency manifests and runner frames.
//
//   - Objects are std::map: keys come out sorted, so identical content
//     always serializes to identical bytes.
//   - Non-negative integers stay exact as uint64; anything signed,
//     fractional or with an exponent becomes double.
//   - \uXXXX escapes (surrogate pairs included) decode to UTF-8. Script
//     output is otherwise passed through byte for byte.
//   - NaN and Infinity are rejected on input.

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace scratchpad::jsonlite {

namespace {

constexpr const char* kParseError = "json_parse_error";

bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void put_utf8(std::string& out, std::uint32_t cp) {
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

class Reader {
 public:
  explicit Reader(std::string_view text) : text_(text) {}

  Value document() {
    Value v = value();
    skip_ws();
    if (!error_ && pos_ != text_.size()) fail(kParseError, "trailing data");
    return v;
  }

  const std::optional<JsonError>& error() const { return error_; }

 private:
  void fail(const char* code, std::string message) {
    if (!error_) error_ = JsonError{code, std::move(message)};
  }

  void skip_ws() {
    while (pos_ < text_.size() && is_ws(text_[pos_])) ++pos_;
  }

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  bool consume(char c) {
    skip_ws();
    if (peek() != c || at_end()) return false;
    ++pos_;
    return true;
  }

  bool literal(std::string_view word) {
    if (text_.substr(pos_, word.size()) != word) return false;
    pos_ += word.size();
    return true;
  }

  Value value() {
    skip_ws();
    if (at_end()) {
      fail(kParseError, "unexpected eof");
      return {};
    }
    switch (peek()) {
      case '{': return Value(object());
      case '[': return Value(array());
      case '"': return Value(string());
      default: break;
    }
    if (literal("true")) return Value(true);
    if (literal("false")) return Value(false);
    if (literal("null")) return Value(nullptr);
    return number();
  }

  bool read_hex4(std::uint32_t& out) {
    if (pos_ + 4 > text_.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const int h = hex_value(text_[pos_++]);
      if (h < 0) return false;
      out = (out << 4) | static_cast<std::uint32_t>(h);
    }
    return true;
  }

  std::string string() {
    std::string out;
    if (!consume('"')) {
      fail(kParseError, "expected string");
      return out;
    }
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
          std::uint32_t cp = 0;
          if (!read_hex4(cp)) {
            fail(kParseError, "invalid unicode escape");
            return {};
          }
          if (cp >= 0xD800 && cp <= 0xDBFF && text_.substr(pos_, 2) == "\\u") {
            pos_ += 2;
            std::uint32_t low = 0;
            if (!read_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
              fail(kParseError, "invalid surrogate pair");
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          }
          put_utf8(out, cp);
          break;
        }
        default: out += esc; break;
      }
    }
    fail(kParseError, "unterminated string");
    return {};
  }

  std::size_t digits() {
    const std::size_t start = pos_;
    while (!at_end() && is_digit(text_[pos_])) ++pos_;
    return pos_ - start;
  }

  Value number() {
    const std::size_t start = pos_;
    bool exact = true;
    if (peek() == '-') {
      ++pos_;
      exact = false;
    }
    if (digits() == 0) {
      fail(kParseError, literal("NaN") || literal("Infinity") ? "NaN/Infinity unsupported"
                                                               : "unexpected token");
      return {};
    }
    if (peek() == '.') {
      ++pos_;
      exact = false;
      if (digits() == 0) {
        fail(kParseError, "invalid number format");
        return {};
      }
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      exact = false;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (digits() == 0) {
        fail(kParseError, "invalid exponent");
        return {};
      }
    }

    const std::string token(text_.substr(start, pos_ - start));
    errno = 0;
    if (exact) {
      const unsigned long long n = std::strtoull(token.c_str(), nullptr, 10);
      if (errno == ERANGE) {
        fail(kParseError, "number out of range");
        return {};
      }
      return Value(static_cast<std::uint64_t>(n));
    }
    const double d = std::strtod(token.c_str(), nullptr);
    if (errno == ERANGE) {
      fail(kParseError, "number out of range");
      return {};
    }
    return Value(d);
  }

  Object object() {
    Object out;
    consume('{');
    if (consume('}')) return out;
    do {
      std::string key = string();
      if (error_) break;
      if (out.contains(key)) {
        fail("json_duplicate_key", "duplicate key: " + key);
        break;
      }
      if (!consume(':')) {
        fail(kParseError, "expected :");
        break;
      }
      Value v = value();
      if (error_) break;
      out.emplace(std::move(key), std::move(v));
      if (consume('}')) return out;
    } while (consume(','));
    fail(kParseError, "expected ,");
    return out;
  }

  Array array() {
    Array out;
    consume('[');
    if (consume(']')) return out;
    do {
      out.push_back(value());
      if (error_) break;
      if (consume(']')) return out;
    } while (consume(','));
    fail(kParseError, "expected ,");
    return out;
  }

  std::string_view text_;
  std::size_t pos_{0};
  std::optional<JsonError> error_;
};

void write_value(std::string& out, const Value& v);

void write_string(std::string& out, const std::string& s) {
  out += '"';
  out += escape(s);
  out += '"';
}

void write_value(std::string& out, const Value& v) {
  if (const auto* s = std::get_if<std::string>(&v.v)) {
    write_string(out, *s);
  } else if (const auto* n = std::get_if<std::uint64_t>(&v.v)) {
    out += std::to_string(*n);
  } else if (const auto* b = std::get_if<bool>(&v.v)) {
    out += *b ? "true" : "false";
  } else if (const auto* d = std::get_if<double>(&v.v)) {
    out += format_double(*d);
  } else if (const auto* o = std::get_if<Object>(&v.v)) {
    out += '{';
    const char* sep = "";
    for (const auto& [key, item] : *o) {
      out += sep;
      sep = ",";
      write_string(out, key);
      out += ':';
      write_value(out, item);
    }
    out += '}';
  } else if (const auto* a = std::get_if<Array>(&v.v)) {
    out += '[';
    const char* sep = "";
    for (const auto& item : *a) {
      out += sep;
      sep = ",";
      write_value(out, item);
    }
    out += ']';
  } else {
    out += "null";
  }
}

}  // namespace

std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

// Six fractional digits, trailing zeros trimmed, at least one digit after '.'.
std::string format_double(double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string out(buf, static_cast<std::size_t>(n));
  const auto last = out.find_last_not_of('0');
  out.erase(last + 1);
  if (out.back() == '.') out += '0';
  return out;
}

std::string to_json(const Value& value) {
  std::string out;
  write_value(out, value);
  return out;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value v = reader.document();
  std::optional<JsonError> err = reader.error();
  if (!err && !std::holds_alternative<Object>(v.v)) err = JsonError{kParseError, "expected object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

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

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return def;
  return std::get<std::uint64_t>(it->second.v);
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) {
      out.push_back(std::get<std::string>(item.v));
    }
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return out;
  for (const auto& [k, v] : std::get<Object>(it->second.v)) {
    if (std::holds_alternative<std::string>(v.v)) {
      out[k] = std::get<std::string>(v.v);
    }
  }
  return out;
}

}  // namespace scratchpad::jsonlite
