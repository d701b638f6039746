// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace statsdudp
{
namespace parsers
{
namespace toml
{

/// \brief Thrown on malformed TOML input
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &message, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + message),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class table;

using value_type =
  std::variant<std::monostate, int64_t, double, bool, std::string, std::shared_ptr<table>>;

class node
{
public:
  node() = default;
  node(const value_type &val) : _value(val) {}
  node(value_type &&val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, int64_t>)
    {
      if (auto *val = std::get_if<int64_t>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<double>(&_value))
        return *val;
      if (auto *val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
      if (auto *val = std::get_if<bool>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
      if (auto *val = std::get_if<std::string>(&_value))
        return *val;
    }
    return std::nullopt;
  }

  table *as_table()
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  const table *as_table() const
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  size_t size() const { return _values.size(); }

  node &operator[](const std::string &key) { return _values[key]; }

  /// \brief Look up "a.b.c" through nested tables; empty node when absent
  node at_path(const std::string &dottedPath) const
  {
    std::stringstream ss(dottedPath);
    std::string part;
    const table *current = this;
    node found;
    while (std::getline(ss, part, '.'))
    {
      if (!current)
        return node();
      auto it = current->_values.find(part);
      if (it == current->_values.end())
        return node();
      found = it->second;
      current = found.as_table();
    }
    return found;
  }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  void insert(const std::string &key, node value) { _values[key] = std::move(value); }

private:
  container_type _values;
};

/// \brief Parser for the TOML subset used by configuration files: tables,
/// dotted tables, key/value pairs with string, integer, float and boolean
/// values, and # comments.
class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *currentTable = &root;

    skipWhitespaceAndComments();
    while (!isEnd())
    {
      if (peek() == '[')
      {
        currentTable = ensureTable(root, parseSection());
      }
      else
      {
        std::string key = parseKey();
        skipWhitespace();
        expect('=');
        skipWhitespace();
        if (currentTable->contains(key))
          fail("duplicate key '" + key + "'");
        currentTable->insert(key, parseValue());
      }
      expectLineEnd();
      skipWhitespaceAndComments();
    }
    return root;
  }

private:
  std::string _input;
  size_t _pos{0};
  size_t _line{1};

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }
  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  [[noreturn]] void fail(const std::string &message) const { throw parse_error(message, _line); }

  void expect(char c)
  {
    if (peek() != c)
      fail(std::string("expected '") + c + "'");
    advance();
  }

  void skipWhitespace()
  {
    while (!isEnd() && (peek() == ' ' || peek() == '\t'))
      advance();
  }

  void skipWhitespaceAndComments()
  {
    while (!isEnd())
    {
      if (std::isspace(static_cast<unsigned char>(peek())))
      {
        advance();
      }
      else if (peek() == '#')
      {
        while (!isEnd() && peek() != '\n')
          advance();
      }
      else
      {
        break;
      }
    }
  }

  void expectLineEnd()
  {
    skipWhitespace();
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
        advance();
    }
    if (isEnd())
      return;
    if (peek() == '\r')
      advance();
    if (peek() != '\n')
      fail("unexpected trailing characters");
    advance();
  }

  std::string parseSection()
  {
    advance(); // skip '['
    skipWhitespace();
    std::string section = parseKey();
    skipWhitespace();
    expect(']');
    return section;
  }

  std::string parseKey()
  {
    std::string key;
    while (!isEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                        peek() == '-' || peek() == '.'))
    {
      key += advance();
    }
    if (key.empty())
      fail("expected key");
    return key;
  }

  node parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return node(parseString());
    if (c == 't' || c == 'f')
      return node(parseBool());
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return node(parseNumber());
    fail("invalid value");
  }

  std::string parseString()
  {
    char quote = advance();
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      // Literal (single-quoted) strings take backslashes verbatim
      if (peek() == '\\' && quote == '"')
      {
        advance();
        char c = advance();
        switch (c)
        {
        case 'n':
          str += '\n';
          break;
        case 't':
          str += '\t';
          break;
        case 'r':
          str += '\r';
          break;
        default:
          str += c;
        }
      }
      else
      {
        str += advance();
      }
    }
    if (peek() != quote)
      fail("unterminated string");
    advance();
    return str;
  }

  bool parseBool()
  {
    std::string word;
    while (!isEnd() && std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();

    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("invalid boolean value: " + word);
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;

    if (peek() == '+' || peek() == '-')
      num += advance();

    while (!isEnd())
    {
      char c = peek();
      if (c == '_')
      {
        advance();
        continue;
      }
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      else if (!std::isdigit(static_cast<unsigned char>(c)) && !(isFloat && (c == '+' || c == '-')))
        break;
      num += advance();
    }

    try
    {
      std::size_t used = 0;
      value_type result;
      if (isFloat)
        result = std::stod(num, &used);
      else
        result = static_cast<int64_t>(std::stoll(num, &used));
      if (used != num.size())
        fail("invalid number: " + num);
      return result;
    }
    catch (const std::logic_error &)
    {
      fail("invalid number: " + num);
    }
  }

  table *ensureTable(table &root, const std::string &path)
  {
    std::stringstream ss(path);
    std::string part;
    table *current = &root;
    while (std::getline(ss, part, '.'))
    {
      if (part.empty())
        fail("empty table name in '" + path + "'");
      if (!current->contains(part))
        current->insert(part, node(std::make_shared<table>()));
      current = (*current)[part].as_table();
      if (!current)
        fail("key '" + part + "' is not a table");
    }
    return current;
  }
};

inline table parse(const std::string &tomlString)
{
  parser p(tomlString);
  return p.parse();
}

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace statsdudp
