// core/json.hpp - Minimal JSON document model
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace converge {
namespace json {

enum class Type { Null, Bool, Number, String, Array, Object };

class Value {
public:
  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : type_(Type::Bool), bool_(b) {}
  Value(int n) : Value(static_cast<long long>(n)) {}
  Value(long n) : Value(static_cast<long long>(n)) {}
  Value(long long n);
  Value(unsigned n) : Value(static_cast<long long>(n)) {}
  Value(unsigned long n) : Value(static_cast<long long>(n)) {}
  Value(unsigned long long n) : Value(static_cast<long long>(n)) {}
  Value(double d);
  Value(const char *s) : type_(Type::String), string_(s) {}
  Value(std::string s) : type_(Type::String), string_(std::move(s)) {}

  static Value array();
  static Value object();

  Type type() const { return type_; }
  bool is_null() const { return type_ == Type::Null; }
  bool is_bool() const { return type_ == Type::Bool; }
  bool is_number() const { return type_ == Type::Number; }
  bool is_integer() const { return type_ == Type::Number && integral_; }
  bool is_string() const { return type_ == Type::String; }
  bool is_array() const { return type_ == Type::Array; }
  bool is_object() const { return type_ == Type::Object; }

  bool as_bool() const { return bool_; }
  std::int64_t as_int() const;
  double as_double() const;
  const std::string &as_string() const { return string_; }

  // Arrays
  void push_back(Value v);
  std::size_t size() const;
  const Value &operator[](std::size_t index) const { return items_[index]; }
  Value &back() { return items_.back(); }
  const std::vector<Value> &items() const { return items_; }

  // Objects; operator[] inserts a null member when the key is missing
  Value &operator[](const std::string &key);
  const Value *find(const std::string &key) const;
  Value *find(const std::string &key);
  bool contains(const std::string &key) const { return find(key) != nullptr; }
  const std::vector<std::string> &keys() const { return keys_; }

private:
  Type type_ = Type::Null;
  bool bool_ = false;
  bool integral_ = false;
  std::int64_t int_ = 0;
  double double_ = 0.0;
  std::string string_;
  std::vector<Value> items_;
  std::vector<std::string> keys_;
};

// Throws std::runtime_error with the byte offset on malformed input
Value parse(const std::string &text);

// indent < 0 produces compact output
std::string dump(const Value &value, int indent = -1);

} // namespace json
} // namespace converge
