// conf/toml.cpp - TOML subset parser
#include "toml.hpp"
#include "../core/error.hpp"
#include <cctype>
#include <fstream>
#include <sstream>

namespace converge {

namespace {

class TomlParser {
public:
  explicit TomlParser(const std::string &text) : text_(text) {}

  json::Value parse() {
    root_ = json::Value::object();
    while (true) {
      skip_blank_lines();
      if (at_end())
        break;

      if (peek() == '[') {
        parse_header();
      } else {
        std::vector<std::string> key = parse_key();
        skip_spaces();
        expect('=');
        json::Value value = parse_value();
        assign(current_table(), key, std::move(value));
      }
      finish_line();
    }
    return root_;
  }

private:
  const std::string &text_;
  std::size_t pos_ = 0;
  int line_ = 1;
  json::Value root_;
  std::vector<std::string> current_path_;

  [[noreturn]] void fail(const std::string &why) const {
    throw Error::invalid_config("line " + std::to_string(line_), why);
  }

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  char advance() {
    char c = text_[pos_++];
    if (c == '\n')
      line_++;
    return c;
  }

  void expect(char c) {
    if (peek() != c)
      fail(std::string("expected '") + c + "'");
    advance();
  }

  void skip_spaces() {
    while (!at_end() && (peek() == ' ' || peek() == '\t'))
      advance();
  }

  void skip_comment() {
    if (peek() == '#') {
      while (!at_end() && peek() != '\n')
        advance();
    }
  }

  void skip_blank_lines() {
    while (!at_end()) {
      skip_spaces();
      skip_comment();
      if (peek() == '\n' || peek() == '\r') {
        advance();
      } else {
        break;
      }
    }
  }

  // Whitespace, newlines and comments inside arrays
  void skip_array_filler() {
    while (!at_end()) {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
        advance();
      } else if (c == '#') {
        skip_comment();
      } else {
        break;
      }
    }
  }

  void finish_line() {
    skip_spaces();
    skip_comment();
    if (peek() == '\r')
      advance();
    if (!at_end() && peek() != '\n')
      fail("unexpected text after value");
  }

  static bool is_bare_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  std::vector<std::string> parse_key() {
    std::vector<std::string> parts;
    while (true) {
      skip_spaces();
      if (peek() == '"') {
        parts.push_back(parse_basic_string());
      } else if (peek() == '\'') {
        parts.push_back(parse_literal_string());
      } else {
        std::string part;
        while (!at_end() && is_bare_key_char(peek()))
          part += advance();
        if (part.empty())
          fail("expected key");
        parts.push_back(part);
      }
      skip_spaces();
      if (peek() != '.')
        break;
      advance();
    }
    return parts;
  }

  void parse_header() {
    advance(); // [
    bool array_of_tables = false;
    if (peek() == '[') {
      advance();
      array_of_tables = true;
    }
    std::vector<std::string> path = parse_key();
    expect(']');
    if (array_of_tables)
      expect(']');

    json::Value *table = &root_;
    for (std::size_t i = 0; i < path.size(); ++i) {
      bool last = i + 1 == path.size();
      json::Value &child = (*table)[path[i]];
      if (last && array_of_tables) {
        if (child.is_null())
          child = json::Value::array();
        if (!child.is_array())
          fail("'" + path[i] + "' is not an array of tables");
        child.push_back(json::Value::object());
        table = &child.back();
      } else {
        table = descend(child, path[i]);
      }
    }
    current_path_ = path;
  }

  json::Value *descend(json::Value &child, const std::string &name) {
    if (child.is_null())
      child = json::Value::object();
    if (child.is_array()) {
      if (child.size() == 0 || !child.back().is_object())
        fail("'" + name + "' is not a table");
      return &child.back();
    }
    if (!child.is_object())
      fail("'" + name + "' is not a table");
    return &child;
  }

  json::Value &current_table() {
    json::Value *table = &root_;
    for (const auto &part : current_path_) {
      table = descend((*table)[part], part);
    }
    return *table;
  }

  void assign(json::Value &table, const std::vector<std::string> &key,
              json::Value value) {
    json::Value *target = &table;
    for (std::size_t i = 0; i + 1 < key.size(); ++i) {
      target = descend((*target)[key[i]], key[i]);
    }
    const std::string &leaf = key.back();
    if (target->contains(leaf))
      fail("duplicate key '" + leaf + "'");
    (*target)[leaf] = std::move(value);
  }

  json::Value parse_value() {
    skip_spaces();
    char c = peek();
    if (c == '"')
      return json::Value(parse_basic_string());
    if (c == '\'')
      return json::Value(parse_literal_string());
    if (c == '[')
      return parse_array();
    if (c == '{')
      return parse_inline_table();
    if (text_.compare(pos_, 4, "true") == 0) {
      pos_ += 4;
      return json::Value(true);
    }
    if (text_.compare(pos_, 5, "false") == 0) {
      pos_ += 5;
      return json::Value(false);
    }
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parse_number();
    fail("invalid value");
  }

  std::string parse_basic_string() {
    advance(); // "
    std::string out;
    while (true) {
      if (at_end() || peek() == '\n')
        fail("unterminated string");
      char c = advance();
      if (c == '"')
        return out;
      if (c != '\\') {
        out += c;
        continue;
      }
      if (at_end())
        fail("unterminated string");
      char e = advance();
      switch (e) {
      case 'n':
        out += '\n';
        break;
      case 't':
        out += '\t';
        break;
      case 'r':
        out += '\r';
        break;
      case '"':
        out += '"';
        break;
      case '\\':
        out += '\\';
        break;
      default:
        fail(std::string("unsupported escape '\\") + e + "'");
      }
    }
  }

  std::string parse_literal_string() {
    advance(); // '
    std::string out;
    while (true) {
      if (at_end() || peek() == '\n')
        fail("unterminated string");
      char c = advance();
      if (c == '\'')
        return out;
      out += c;
    }
  }

  json::Value parse_number() {
    std::string token;
    bool is_float = false;
    while (!at_end()) {
      char c = peek();
      if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-') {
        token += advance();
      } else if (c == '.' || c == 'e' || c == 'E') {
        is_float = true;
        token += advance();
      } else if (c == '_') {
        advance();
      } else {
        break;
      }
    }
    try {
      std::size_t used = 0;
      if (is_float) {
        double d = std::stod(token, &used);
        if (used == token.size())
          return json::Value(d);
      } else {
        long long n = std::stoll(token, &used);
        if (used == token.size())
          return json::Value(n);
      }
    } catch (const std::exception &) {
      // reported below
    }
    fail("invalid number '" + token + "'");
  }

  json::Value parse_array() {
    advance(); // [
    json::Value arr = json::Value::array();
    while (true) {
      skip_array_filler();
      if (peek() == ']') {
        advance();
        return arr;
      }
      arr.push_back(parse_value());
      skip_array_filler();
      if (peek() == ',') {
        advance();
        continue;
      }
      if (peek() == ']') {
        advance();
        return arr;
      }
      fail("expected ',' or ']' in array");
    }
  }

  json::Value parse_inline_table() {
    advance(); // {
    json::Value table = json::Value::object();
    skip_spaces();
    if (peek() == '}') {
      advance();
      return table;
    }
    while (true) {
      std::vector<std::string> key = parse_key();
      skip_spaces();
      expect('=');
      json::Value value = parse_value();
      assign(table, key, std::move(value));
      skip_spaces();
      if (peek() == ',') {
        advance();
        continue;
      }
      if (peek() == '}') {
        advance();
        return table;
      }
      fail("expected ',' or '}' in inline table");
    }
  }
};

} // namespace

json::Value parse_toml(const std::string &text) {
  return TomlParser(text).parse();
}

json::Value parse_toml_file(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw Error::invalid_config(path.string(), "cannot open file");
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  try {
    return parse_toml(buffer.str());
  } catch (const Error &e) {
    throw Error::invalid_config(path.string() + ":" + e.field("where"),
                                e.field("why"));
  }
}

} // namespace converge
