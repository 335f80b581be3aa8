#include "colonia/util/json.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace colonia::json {
namespace {

class Parser {
 public:
  explicit Parser(const std::string& s) : s_(s) {
    // Tolerate a UTF-8 BOM; editors on some platforms add one to config files.
    if (s_.size() >= 3 && static_cast<unsigned char>(s_[0]) == 0xEF &&
        static_cast<unsigned char>(s_[1]) == 0xBB && static_cast<unsigned char>(s_[2]) == 0xBF) {
      i_ = 3;
    }
  }

  Value document() {
    Value v = value(0);
    skip_ws();
    if (i_ != s_.size()) fail("trailing characters after document");
    return v;
  }

 private:
  static constexpr int kMaxDepth = 256;

  const std::string& s_;
  std::size_t i_{0};

  char peek() const { return i_ < s_.size() ? s_[i_] : '\0'; }
  char get() { return i_ < s_.size() ? s_[i_++] : '\0'; }

  void skip_ws() {
    while (i_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
  }

  [[noreturn]] void fail(const std::string& msg) const {
    int line = 1;
    int col = 1;
    for (std::size_t k = 0; k < i_ && k < s_.size(); ++k) {
      if (s_[k] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    std::ostringstream ss;
    ss << "JSON parse error (line " << line << ", col " << col << "): " << msg;
    throw std::runtime_error(ss.str());
  }

  void expect(char c) {
    skip_ws();
    if (get() != c) fail(std::string("expected '") + c + "'");
  }

  Value value(int depth) {
    if (depth > kMaxDepth) fail("document nested too deeply");
    skip_ws();
    const char c = peek();
    switch (c) {
      case 'n': return literal("null", Value(nullptr));
      case 't': return literal("true", Value(true));
      case 'f': return literal("false", Value(false));
      case '"': return Value(string());
      case '[': return array(depth);
      case '{': return object(depth);
      default: break;
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return number();
    fail("unexpected character");
  }

  Value literal(const char* lit, Value v) {
    for (const char* p = lit; *p; ++p) {
      if (get() != *p) fail("invalid literal");
    }
    return v;
  }

  Value number() {
    const std::size_t start = i_;
    bool integral = true;
    if (peek() == '-') ++i_;
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++i_;
    if (peek() == '.') {
      integral = false;
      ++i_;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number fraction");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++i_;
    }
    if (peek() == 'e' || peek() == 'E') {
      integral = false;
      ++i_;
      if (peek() == '+' || peek() == '-') ++i_;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid exponent");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++i_;
    }
    const std::string text = s_.substr(start, i_ - start);
    if (integral) {
      try {
        return Value(static_cast<long long>(std::stoll(text)));
      } catch (const std::out_of_range&) {
        // Falls through to a real for integers that do not fit.
      }
    }
    try {
      return Value(std::stod(text));
    } catch (const std::exception&) {
      fail("number out of range");
    }
  }

  unsigned hex4() {
    unsigned code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = get();
      code <<= 4;
      if (h >= '0' && h <= '9') code += static_cast<unsigned>(h - '0');
      else if (h >= 'a' && h <= 'f') code += static_cast<unsigned>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') code += static_cast<unsigned>(h - 'A' + 10);
      else fail("bad unicode escape");
    }
    return code;
  }

  static void put_utf8(std::uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
      out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  std::string string() {
    expect('"');
    std::string out;
    for (;;) {
      if (i_ >= s_.size()) fail("unterminated string");
      const char c = get();
      if (c == '"') break;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char e = get();
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          const unsigned hi = hex4();
          if (hi >= 0xD800 && hi <= 0xDBFF) {
            if (get() != '\\' || get() != 'u') fail("expected low surrogate");
            const unsigned lo = hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            put_utf8(0x10000u + (((hi - 0xD800u) << 10) | (lo - 0xDC00u)), out);
          } else if (hi >= 0xDC00 && hi <= 0xDFFF) {
            fail("unexpected low surrogate");
          } else {
            put_utf8(hi, out);
          }
          break;
        }
        default: fail("unknown escape");
      }
    }
    return out;
  }

  Value array(int depth) {
    expect('[');
    Array arr;
    skip_ws();
    if (peek() == ']') {
      ++i_;
      return Value(std::move(arr));
    }
    for (;;) {
      arr.push_back(value(depth + 1));
      skip_ws();
      const char c = get();
      if (c == ']') break;
      if (c != ',') fail("expected ',' or ']'");
    }
    return Value(std::move(arr));
  }

  Value object(int depth) {
    expect('{');
    Object obj;
    skip_ws();
    if (peek() == '}') {
      ++i_;
      return Value(std::move(obj));
    }
    for (;;) {
      skip_ws();
      if (peek() != '"') fail("expected string key");
      std::string key = string();
      expect(':');
      obj[std::move(key)] = value(depth + 1);
      skip_ws();
      const char c = get();
      if (c == '}') break;
      if (c != ',') fail("expected ',' or '}'");
    }
    return Value(std::move(obj));
  }
};

void write_escaped(const std::string& in, std::string& out) {
  out.push_back('"');
  for (const char c : in) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
}

void write_value(const Value& v, std::string& out, int indent, int depth) {
  const auto newline = [&](int d) {
    if (indent <= 0) return;
    out.push_back('\n');
    out.append(static_cast<std::size_t>(d * indent), ' ');
  };

  if (v.is_null()) {
    out += "null";
  } else if (const bool* b = std::get_if<bool>(&v.data)) {
    out += *b ? "true" : "false";
  } else if (const std::int64_t* n = std::get_if<std::int64_t>(&v.data)) {
    out += std::to_string(*n);
  } else if (const double* d = std::get_if<double>(&v.data)) {
    if (!std::isfinite(*d)) {
      out += "null";
    } else {
      std::ostringstream ss;
      ss.precision(std::numeric_limits<double>::max_digits10);
      ss << *d;
      out += ss.str();
    }
  } else if (const std::string* s = v.as_string()) {
    write_escaped(*s, out);
  } else if (const Array* a = v.as_array()) {
    out.push_back('[');
    for (std::size_t k = 0; k < a->size(); ++k) {
      if (k) out.push_back(',');
      newline(depth + 1);
      write_value((*a)[k], out, indent, depth + 1);
    }
    if (!a->empty()) newline(depth);
    out.push_back(']');
  } else if (const Object* o = v.as_object()) {
    out.push_back('{');
    bool first = true;
    for (const auto& [key, val] : *o) {
      if (!first) out.push_back(',');
      first = false;
      newline(depth + 1);
      write_escaped(key, out);
      out.push_back(':');
      if (indent > 0) out.push_back(' ');
      write_value(val, out, indent, depth + 1);
    }
    if (!o->empty()) newline(depth);
    out.push_back('}');
  }
}

} // namespace

const Value& Value::at(const std::string& key) const {
  const Value* v = find(key);
  if (!v) throw std::runtime_error("JSON key not found: " + key);
  return *v;
}

const Value* Value::find(const std::string& key) const {
  const Object* o = as_object();
  if (!o) return nullptr;
  auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

bool Value::bool_value(bool def) const {
  const bool* b = std::get_if<bool>(&data);
  return b ? *b : def;
}

double Value::number_value(double def) const {
  if (const double* d = std::get_if<double>(&data)) return *d;
  if (const std::int64_t* n = std::get_if<std::int64_t>(&data)) return static_cast<double>(*n);
  return def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  if (const std::int64_t* n = std::get_if<std::int64_t>(&data)) return *n;
  if (const double* d = std::get_if<double>(&data)) return static_cast<std::int64_t>(std::llround(*d));
  return def;
}

std::string Value::string_value(const std::string& def) const {
  const std::string* s = as_string();
  return s ? *s : def;
}

const Object& Value::object() const {
  const Object* o = as_object();
  if (!o) throw std::runtime_error("JSON value is not an object");
  return *o;
}

const Array& Value::array() const {
  const Array* a = as_array();
  if (!a) throw std::runtime_error("JSON value is not an array");
  return *a;
}

Value parse(const std::string& text) {
  Parser p(text);
  return p.document();
}

std::string stringify(const Value& v, int indent) {
  std::string out;
  write_value(v, out, indent, 0);
  return out;
}

} // namespace colonia::json
