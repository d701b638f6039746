// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <statsdudp/network/transport_errors.hpp>
#include <statsdudp/parsers/minimal_toml.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace statsdudp
{
namespace core
{
/// \brief Loads and parses TOML configuration files.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws ConfigurationError if the file cannot be read or parsed
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Builds a loader over in-memory TOML text.
  static ConfigLoader fromString(const std::string &toml)
  {
    ConfigLoader loader;
    try
    {
      loader._table = parsers::toml::parse(toml);
    }
    catch (const std::exception &e)
    {
      throw ConfigurationError(e.what());
    }
    return loader;
  }

  /// \brief Reloads the configuration from disk.
  /// \return false (keeping the previous table) when the file is unreadable
  bool reload()
  {
    if (_filename.empty())
    {
      return false;
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
      return true;
    }
    catch (const std::exception &)
    {
      return false;
    }
  }

  const parsers::toml::table &load()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
    }
    catch (const std::exception &e)
    {
      throw ConfigurationError("failed to load configuration file " + _filename + ": " +
                               e.what());
    }
    return _table;
  }

  const std::string &filename() const { return _filename; }

  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  /// \brief True when the key exists, whatever its type
  bool contains(const std::string &dottedKey) const
  {
    return static_cast<bool>(_table.at_path(dottedKey));
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

private:
  ConfigLoader() = default;

  std::string _filename;
  parsers::toml::table _table;
};

} // namespace core
} // namespace statsdudp
