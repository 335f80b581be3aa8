#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace colonia::json {

struct Value;
using Array = std::vector<Value>;
// Ordered so that stringify() output is stable without a sort pass.
using Object = std::map<std::string, Value>;

// JSON value (null, bool, integer, real, string, array, object).
//
// Integers are kept apart from reals so that 64-bit entity ids survive a
// round trip unchanged.
struct Value {
  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object> data;

  Value() : data(nullptr) {}
  Value(std::nullptr_t) : data(nullptr) {}
  Value(bool b) : data(b) {}
  Value(int v) : data(static_cast<std::int64_t>(v)) {}
  Value(long v) : data(static_cast<std::int64_t>(v)) {}
  Value(long long v) : data(static_cast<std::int64_t>(v)) {}
  Value(unsigned v) : data(static_cast<std::int64_t>(v)) {}
  Value(unsigned long v) : data(static_cast<std::int64_t>(v)) {}
  Value(unsigned long long v) : data(static_cast<std::int64_t>(v)) {}
  Value(double v) : data(v) {}
  Value(const char* s) : data(std::string(s)) {}
  Value(std::string s) : data(std::move(s)) {}
  Value(Array a) : data(std::move(a)) {}
  Value(Object o) : data(std::move(o)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(data); }
  bool is_bool() const { return std::holds_alternative<bool>(data); }
  bool is_int() const { return std::holds_alternative<std::int64_t>(data); }
  bool is_number() const { return is_int() || std::holds_alternative<double>(data); }
  bool is_string() const { return std::holds_alternative<std::string>(data); }
  bool is_array() const { return std::holds_alternative<Array>(data); }
  bool is_object() const { return std::holds_alternative<Object>(data); }

  const std::string* as_string() const { return std::get_if<std::string>(&data); }
  const Array* as_array() const { return std::get_if<Array>(&data); }
  const Object* as_object() const { return std::get_if<Object>(&data); }
  Array* as_array() { return std::get_if<Array>(&data); }
  Object* as_object() { return std::get_if<Object>(&data); }

  // Throws std::runtime_error if not an object / key missing.
  const Value& at(const std::string& key) const;
  // nullptr if not an object or key missing.
  const Value* find(const std::string& key) const;

  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::int64_t int_value(std::int64_t def = 0) const;
  std::string string_value(const std::string& def = "") const;

  // Throw std::runtime_error on wrong type.
  const Object& object() const;
  const Array& array() const;

  bool operator==(const Value& o) const { return data == o.data; }
  bool operator!=(const Value& o) const { return !(*this == o); }
};

// Parse a JSON document. Throws std::runtime_error with line/column on failure.
Value parse(const std::string& text);

// indent <= 0 produces a single line (used on the wire).
std::string stringify(const Value& v, int indent = 2);

} // namespace colonia::json
