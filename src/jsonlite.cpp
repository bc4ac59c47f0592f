#include "vellum/jsonlite.hpp"

// DETERMINISM GUARANTEES:
//   - to_json() emits objects with sorted keys (std::map iteration).
//   - Doubles print as "%.6f" with trailing zeros trimmed; locale independent.
//   - Non-negative integers that fit in u64 stay integers; anything with a
//     sign, fraction or exponent becomes a double.
//
// Snapshots and audit lines are read back from disk, so the reader is strict.
// It rejects raw control characters, duplicate keys, NaN/Infinity, trailing
// data and nesting deeper than kMaxDepth.

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string_view>
#include <type_traits>

namespace vellum::jsonlite {

namespace {

constexpr int kMaxDepth = 64;

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

int hex_value(char h) {
  if (h >= '0' && h <= '9') return h - '0';
  if (h >= 'a' && h <= 'f') return h - 'a' + 10;
  if (h >= 'A' && h <= 'F') return h - 'A' + 10;
  return -1;
}

void append_utf8(std::string& out, uint32_t cp) {
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
  explicit Reader(const std::string& text) : s_(text) {}

  // Reads exactly one value spanning the whole input.
  Value read_document() {
    Value v;
    if (read_value(v, 0)) {
      skip_ws();
      if (pos_ != s_.size()) fail("json_parse_error", "trailing data");
    }
    return ok() ? v : Value{};
  }

  const std::optional<JsonError>& error() const { return err_; }

 private:
  bool ok() const { return !err_.has_value(); }

  bool fail(const char* code, const std::string& message) {
    if (!err_) err_ = JsonError{code, message + " at offset " + std::to_string(pos_)};
    return false;
  }

  void skip_ws() {
    while (pos_ < s_.size() && is_space(s_[pos_])) ++pos_;
  }

  bool consume(char c) {
    skip_ws();
    if (pos_ < s_.size() && s_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool literal(std::string_view word, Value v, Value& out) {
    if (s_.compare(pos_, word.size(), word) != 0) return fail("json_parse_error", "unexpected token");
    pos_ += word.size();
    out = std::move(v);
    return true;
  }

  bool read_value(Value& out, int depth) {
    if (depth > kMaxDepth) return fail("json_parse_error", "nesting too deep");
    skip_ws();
    if (pos_ >= s_.size()) return fail("json_parse_error", "unexpected end of input");
    switch (s_[pos_]) {
      case '{': {
        Object o;
        if (!read_object(o, depth)) return false;
        out = Value{std::move(o)};
        return true;
      }
      case '[': {
        Array a;
        if (!read_array(a, depth)) return false;
        out = Value{std::move(a)};
        return true;
      }
      case '"': {
        std::string str;
        if (!read_string(str)) return false;
        out = Value{std::move(str)};
        return true;
      }
      case 't': return literal("true", Value{true}, out);
      case 'f': return literal("false", Value{false}, out);
      case 'n': return literal("null", Value{nullptr}, out);
      default: return read_number(out);
    }
  }

  bool read_hex4(uint32_t& cp) {
    if (pos_ + 4 > s_.size()) return fail("json_parse_error", "short unicode escape");
    cp = 0;
    for (int k = 0; k < 4; ++k) {
      const int h = hex_value(s_[pos_++]);
      if (h < 0) return fail("json_parse_error", "bad unicode escape");
      cp = (cp << 4) | static_cast<uint32_t>(h);
    }
    return true;
  }

  bool read_escape(std::string& out) {
    if (pos_ >= s_.size()) return fail("json_parse_error", "unterminated escape");
    switch (s_[pos_++]) {
      case '"': out += '"'; return true;
      case '\\': out += '\\'; return true;
      case '/': out += '/'; return true;
      case 'b': out += '\b'; return true;
      case 'f': out += '\f'; return true;
      case 'n': out += '\n'; return true;
      case 'r': out += '\r'; return true;
      case 't': out += '\t'; return true;
      case 'u': {
        uint32_t cp = 0;
        if (!read_hex4(cp)) return false;
        if (cp >= 0xDC00 && cp <= 0xDFFF) return fail("json_parse_error", "lone surrogate");
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          if (s_.compare(pos_, 2, "\\u") != 0) return fail("json_parse_error", "lone surrogate");
          pos_ += 2;
          uint32_t low = 0;
          if (!read_hex4(low)) return false;
          if (low < 0xDC00 || low > 0xDFFF) return fail("json_parse_error", "bad surrogate pair");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        append_utf8(out, cp);
        return true;
      }
      default:
        return fail("json_parse_error", "invalid escape");
    }
  }

  bool read_string(std::string& out) {
    if (!consume('"')) return fail("json_parse_error", "expected string");
    while (pos_ < s_.size()) {
      const char c = s_[pos_++];
      if (c == '"') return true;
      if (static_cast<unsigned char>(c) < 0x20) return fail("json_parse_error", "raw control character");
      if (c != '\\') {
        out += c;
      } else if (!read_escape(out)) {
        return false;
      }
    }
    return fail("json_parse_error", "unterminated string");
  }

  bool read_digits() {
    const size_t start = pos_;
    while (pos_ < s_.size() && is_digit(s_[pos_])) ++pos_;
    return pos_ > start;
  }

  bool read_number(Value& out) {
    const size_t start = pos_;
    bool integral = true;
    if (s_[pos_] == '-') {
      integral = false;
      ++pos_;
    }
    if (!read_digits()) return fail("json_parse_error", "unexpected token");
    if (pos_ < s_.size() && s_[pos_] == '.') {
      integral = false;
      ++pos_;
      if (!read_digits()) return fail("json_parse_error", "invalid number format");
    }
    if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
      integral = false;
      ++pos_;
      if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) ++pos_;
      if (!read_digits()) return fail("json_parse_error", "invalid exponent");
    }

    const std::string token = s_.substr(start, pos_ - start);
    errno = 0;
    if (integral) {
      const unsigned long long n = std::strtoull(token.c_str(), nullptr, 10);
      if (errno == ERANGE) return fail("json_parse_error", "number out of range");
      out = Value{static_cast<std::uint64_t>(n)};
    } else {
      const double d = std::strtod(token.c_str(), nullptr);
      if (errno == ERANGE) return fail("json_parse_error", "number out of range");
      out = Value{d};
    }
    return true;
  }

  bool read_object(Object& out, int depth) {
    consume('{');
    if (consume('}')) return true;
    do {
      std::string key;
      if (!read_string(key)) return false;
      if (out.count(key)) return fail("json_duplicate_key", "duplicate key: " + key);
      if (!consume(':')) return fail("json_parse_error", "expected ':'");
      Value v;
      if (!read_value(v, depth + 1)) return false;
      out.emplace(std::move(key), std::move(v));
    } while (consume(','));
    return consume('}') || fail("json_parse_error", "expected ',' or '}'");
  }

  bool read_array(Array& out, int depth) {
    consume('[');
    if (consume(']')) return true;
    do {
      Value v;
      if (!read_value(v, depth + 1)) return false;
      out.push_back(std::move(v));
    } while (consume(','));
    return consume(']') || fail("json_parse_error", "expected ',' or ']'");
  }

  const std::string& s_;
  size_t pos_{0};
  std::optional<JsonError> err_;
};

void append_escaped(std::string& out, const std::string& s) {
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
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
}

void append_double(std::string& out, double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) {
    out += "0.0";
    return;
  }
  std::string text(buf, static_cast<size_t>(n));
  while (text.back() == '0') text.pop_back();
  if (text.back() == '.') text += '0';
  out += text;
}

void write(std::string& out, const Value& v) {
  std::visit(
      [&out](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          out += x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
          out += std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
          append_double(out, x);
        } else if constexpr (std::is_same_v<T, std::string>) {
          out += '"';
          append_escaped(out, x);
          out += '"';
        } else if constexpr (std::is_same_v<T, Array>) {
          out += '[';
          for (size_t i = 0; i < x.size(); ++i) {
            if (i) out += ',';
            write(out, x[i]);
          }
          out += ']';
        } else {
          out += '{';
          bool first = true;
          for (const auto& [k, item] : x) {
            if (!first) out += ',';
            first = false;
            out += '"';
            append_escaped(out, k);
            out += "\":";
            write(out, item);
          }
          out += '}';
        }
      },
      v.v);
}

Value read_all(const std::string& text, std::optional<JsonError>& err) {
  Reader reader(text);
  Value v = reader.read_document();
  err = reader.error();
  return v;
}

// Pointer to the T held under `key`, or nullptr.
template <typename T>
const T* find_as(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<T>(&it->second.v);
}

}  // namespace

std::string to_json(const Value& v) {
  std::string out;
  write(out, v);
  return out;
}

std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  append_escaped(out, s);
  return out;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = read_all(text, err);
  if (error) *error = err;
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = read_all(text, err);
  if (!err && !v.is_object()) err = JsonError{"json_parse_error", "expected object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::optional<JsonError> validate_strict(const std::string& text) {
  std::optional<JsonError> err;
  read_all(text, err);
  return err;
}

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = read_all(text, err);
  if (error) *error = err;
  return err ? std::string() : to_json(v);
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* p = find_as<std::string>(obj, key);
  return p ? *p : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* p = find_as<bool>(obj, key);
  return p ? *p : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* p = find_as<std::uint64_t>(obj, key);
  return p ? *p : def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  if (const auto* d = find_as<double>(obj, key)) return *d;
  if (const auto* n = find_as<std::uint64_t>(obj, key)) return static_cast<double>(*n);
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  if (const auto* arr = find_as<Array>(obj, key)) {
    for (const auto& item : *arr) {
      if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
    }
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  if (const auto* o = find_as<Object>(obj, key)) {
    for (const auto& [k, item] : *o) {
      if (const auto* s = std::get_if<std::string>(&item.v)) out[k] = *s;
    }
  }
  return out;
}

const Object* get_object(const Object& obj, const std::string& key) {
  return find_as<Object>(obj, key);
}

const Array* get_array(const Object& obj, const std::string& key) {
  return find_as<Array>(obj, key);
}

}  // namespace vellum::jsonlite
