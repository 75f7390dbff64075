// core/json.cpp - JSON parsing and serialization
#include "json.hpp"
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace converge {
namespace json {

Value::Value(long long n)
    : type_(Type::Number), integral_(true), int_(n),
      double_(static_cast<double>(n)) {}

Value::Value(double d) : type_(Type::Number), double_(d) {}

Value Value::array() {
  Value v;
  v.type_ = Type::Array;
  return v;
}

Value Value::object() {
  Value v;
  v.type_ = Type::Object;
  return v;
}

std::int64_t Value::as_int() const {
  return integral_ ? int_ : static_cast<std::int64_t>(double_);
}

double Value::as_double() const { return double_; }

void Value::push_back(Value v) {
  if (type_ == Type::Null)
    type_ = Type::Array;
  items_.push_back(std::move(v));
}

std::size_t Value::size() const {
  if (type_ == Type::Array || type_ == Type::Object)
    return items_.size();
  return 0;
}

Value &Value::operator[](const std::string &key) {
  if (type_ == Type::Null)
    type_ = Type::Object;
  if (Value *existing = find(key))
    return *existing;
  keys_.push_back(key);
  items_.emplace_back();
  return items_.back();
}

const Value *Value::find(const std::string &key) const {
  if (type_ != Type::Object)
    return nullptr;
  for (std::size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] == key)
      return &items_[i];
  }
  return nullptr;
}

Value *Value::find(const std::string &key) {
  return const_cast<Value *>(static_cast<const Value *>(this)->find(key));
}

namespace {

class Parser {
public:
  explicit Parser(const std::string &text) : text_(text) {}

  Value parse_document() {
    Value v = parse_value();
    skip_ws();
    if (pos_ != text_.size())
      fail("trailing characters");
    return v;
  }

private:
  const std::string &text_;
  std::size_t pos_ = 0;

  [[noreturn]] void fail(const std::string &why) const {
    throw std::runtime_error("json: " + why + " at offset " +
                             std::to_string(pos_));
  }

  void skip_ws() {
    while (pos_ < text_.size() &&
           (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' ||
            text_[pos_] == '\r'))
      pos_++;
  }

  bool consume_literal(const char *lit) {
    std::string s(lit);
    if (text_.compare(pos_, s.size(), s) == 0) {
      pos_ += s.size();
      return true;
    }
    return false;
  }

  Value parse_value() {
    skip_ws();
    if (pos_ >= text_.size())
      fail("unexpected end of input");

    char c = text_[pos_];
    if (c == '{')
      return parse_object();
    if (c == '[')
      return parse_array();
    if (c == '"')
      return Value(parse_string());
    if (consume_literal("true"))
      return Value(true);
    if (consume_literal("false"))
      return Value(false);
    if (consume_literal("null"))
      return Value();
    if (c == '-' || (c >= '0' && c <= '9'))
      return parse_number();
    fail(std::string("unexpected character '") + c + "'");
  }

  Value parse_object() {
    Value obj = Value::object();
    pos_++; // {
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      pos_++;
      return obj;
    }
    while (true) {
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != '"')
        fail("expected object key");
      std::string key = parse_string();
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != ':')
        fail("expected ':'");
      pos_++;
      obj[key] = parse_value();
      skip_ws();
      if (pos_ < text_.size() && text_[pos_] == ',') {
        pos_++;
        continue;
      }
      if (pos_ < text_.size() && text_[pos_] == '}') {
        pos_++;
        return obj;
      }
      fail("expected ',' or '}'");
    }
  }

  Value parse_array() {
    Value arr = Value::array();
    pos_++; // [
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      pos_++;
      return arr;
    }
    while (true) {
      arr.push_back(parse_value());
      skip_ws();
      if (pos_ < text_.size() && text_[pos_] == ',') {
        pos_++;
        continue;
      }
      if (pos_ < text_.size() && text_[pos_] == ']') {
        pos_++;
        return arr;
      }
      fail("expected ',' or ']'");
    }
  }

  static void append_utf8(std::string &out, unsigned cp) {
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

  unsigned parse_hex4() {
    if (pos_ + 4 > text_.size())
      fail("truncated \\u escape");
    unsigned cp = 0;
    for (int i = 0; i < 4; ++i) {
      char h = text_[pos_++];
      cp <<= 4;
      if (h >= '0' && h <= '9')
        cp |= static_cast<unsigned>(h - '0');
      else if (h >= 'a' && h <= 'f')
        cp |= static_cast<unsigned>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F')
        cp |= static_cast<unsigned>(h - 'A' + 10);
      else
        fail("bad hex digit");
    }
    return cp;
  }

  std::string parse_string() {
    pos_++; // opening quote
    std::string out;
    while (pos_ < text_.size()) {
      char c = text_[pos_++];
      if (c == '"')
        return out;
      if (c != '\\') {
        out += c;
        continue;
      }
      if (pos_ >= text_.size())
        break;
      char e = text_[pos_++];
      switch (e) {
      case '"':
      case '\\':
      case '/':
        out += e;
        break;
      case 'b':
        out += '\b';
        break;
      case 'f':
        out += '\f';
        break;
      case 'n':
        out += '\n';
        break;
      case 'r':
        out += '\r';
        break;
      case 't':
        out += '\t';
        break;
      case 'u': {
        unsigned cp = parse_hex4();
        if (cp >= 0xD800 && cp <= 0xDBFF && text_.compare(pos_, 2, "\\u") == 0) {
          pos_ += 2;
          unsigned low = parse_hex4();
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        append_utf8(out, cp);
        break;
      }
      default:
        fail("bad escape");
      }
    }
    fail("unterminated string");
  }

  Value parse_number() {
    std::size_t start = pos_;
    bool is_float = false;
    if (text_[pos_] == '-')
      pos_++;
    while (pos_ < text_.size()) {
      char c = text_[pos_];
      if (c >= '0' && c <= '9') {
        pos_++;
      } else if (c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
        is_float = true;
        pos_++;
      } else {
        break;
      }
    }
    std::string token = text_.substr(start, pos_ - start);
    try {
      if (is_float)
        return Value(std::stod(token));
      return Value(std::stoll(token));
    } catch (const std::exception &) {
      fail("bad number '" + token + "'");
    }
  }
};

void escape_string(std::string &out, const std::string &s) {
  out += '"';
  for (char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        out += buf;
      } else {
        out += c;
      }
    }
  }
  out += '"';
}

void dump_into(std::string &out, const Value &v, int indent, int depth) {
  auto newline = [&](int d) {
    if (indent < 0)
      return;
    out += '\n';
    out.append(static_cast<std::size_t>(indent * d), ' ');
  };

  switch (v.type()) {
  case Type::Null:
    out += "null";
    break;
  case Type::Bool:
    out += v.as_bool() ? "true" : "false";
    break;
  case Type::Number:
    if (v.is_integer()) {
      out += std::to_string(v.as_int());
    } else if (std::isfinite(v.as_double())) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.17g", v.as_double());
      out += buf;
    } else {
      out += "null";
    }
    break;
  case Type::String:
    escape_string(out, v.as_string());
    break;
  case Type::Array:
    out += '[';
    for (std::size_t i = 0; i < v.size(); ++i) {
      if (i > 0)
        out += ',';
      newline(depth + 1);
      dump_into(out, v[i], indent, depth + 1);
    }
    if (v.size() > 0)
      newline(depth);
    out += ']';
    break;
  case Type::Object: {
    out += '{';
    const auto &keys = v.keys();
    for (std::size_t i = 0; i < keys.size(); ++i) {
      if (i > 0)
        out += ',';
      newline(depth + 1);
      escape_string(out, keys[i]);
      out += indent < 0 ? ":" : ": ";
      dump_into(out, v.items()[i], indent, depth + 1);
    }
    if (!keys.empty())
      newline(depth);
    out += '}';
    break;
  }
  }
}

} // namespace

Value parse(const std::string &text) { return Parser(text).parse_document(); }

std::string dump(const Value &value, int indent) {
  std::string out;
  dump_into(out, value, indent, 0);
  return out;
}

} // namespace json
} // namespace converge
