/* Common exceptions.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cerrno>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <jansson.h>

namespace devbind {

class SystemError : public std::system_error {

public:
  SystemError(const std::string &what)
      : std::system_error(errno, std::system_category(), what) {}

  template <typename... Args>
  SystemError(const std::string &what, Args &&...args)
      : SystemError(fmt::format(what, std::forward<Args>(args)...)) {}
};

class RuntimeError : public std::runtime_error {

public:
  template <typename... Args>
  RuntimeError(const std::string &what, Args &&...args)
      : std::runtime_error(fmt::format(what, std::forward<Args>(args)...)) {}
};

class JanssonParseError : public std::runtime_error {

protected:
  json_error_t error;

public:
  JanssonParseError(const json_error_t &e)
      : std::runtime_error(fmt::format("Failed to parse JSON: {} in {}:{}:{}",
                                       e.text, e.source, e.line, e.column)),
        error(e) {}

  int getLine() const { return error.line; }

  int getColumn() const { return error.column; }
};

class ConfigError : public std::runtime_error {

protected:
  // A setting-id referencing the setting.
  std::string id;
  json_t *setting;
  json_error_t error;

  std::string msg;

  std::string getMessage() const {
    std::stringstream ss;

    ss << std::runtime_error::what();

    if (!id.empty())
      ss << " (" << id << ")";

    if (error.position >= 0)
      ss << ": " << error.text << " in " << error.source << ":" << error.line
         << ":" << error.column;

    return ss.str();
  }

public:
  ConfigError(json_t *s, const std::string &i,
              const std::string &what = "Failed to parse configuration")
      : std::runtime_error(what), id(i), setting(s), error() {
    error.position = -1;

    msg = getMessage();
  }

  template <typename... Args>
  ConfigError(json_t *s, const std::string &i, const std::string &what,
              Args &&...args)
      : std::runtime_error(fmt::format(what, std::forward<Args>(args)...)),
        id(i), setting(s), error() {
    error.position = -1;

    msg = getMessage();
  }

  ConfigError(json_t *s, const json_error_t &e, const std::string &i,
              const std::string &what = "Failed to parse configuration")
      : std::runtime_error(what), id(i), setting(s), error(e) {
    msg = getMessage();
  }

  template <typename... Args>
  ConfigError(json_t *s, const json_error_t &e, const std::string &i,
              const std::string &what, Args &&...args)
      : std::runtime_error(fmt::format(what, std::forward<Args>(args)...)),
        id(i), setting(s), error(e) {
    msg = getMessage();
  }

  const std::string &getId() const { return id; }

  json_t *getSetting() const { return setting; }

  virtual const char *what() const noexcept { return msg.c_str(); }
};

} // namespace devbind
