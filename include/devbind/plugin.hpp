/* Loadable / plugin support.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <list>
#include <string>

#include <devbind/log.hpp>

namespace devbind {
namespace plugin {

// Forward declarations
class Plugin;
class Registry;

extern Registry *registry;

template <typename T = Plugin> using List = std::list<T *>;

class Registry {

protected:
  List<> plugins;

public:
  Logger getLogger() { return Log::get("plugin:registry"); }

  void add(Plugin *p) { plugins.push_back(p); }

  void remove(Plugin *p) { plugins.remove(p); }

  // Get all plugins
  List<> lookup() { return plugins; }

  // Get all plugins of specific type
  template <typename T = Plugin> List<T> lookup() {
    List<T> list;

    for (Plugin *p : plugins) {
      T *t = dynamic_cast<T *>(p);
      if (t)
        list.push_back(t);
    }

    // Sort alphabetically
    list.sort([](const T *a, const T *b) {
      return a->getName() < b->getName();
    });

    return list;
  }

  // Get all plugins of specific type and name
  template <typename T = Plugin> T *lookup(const std::string &name) {
    for (T *p : lookup<T>()) {
      if (p->getName() != name)
        continue;

      return p;
    }

    return nullptr;
  }

  template <typename T = Plugin> void dump();
};

class Plugin {

  friend plugin::Registry;

protected:
  Logger logger;

public:
  Plugin();

  virtual ~Plugin();

  // Copying a plugin doesn't make sense, so explicitly deny it
  Plugin(Plugin const &) = delete;
  void operator=(Plugin const &) = delete;

  virtual void dump();

  // Get plugin name
  virtual std::string getName() const = 0;

  // Get plugin type
  virtual std::string getType() const = 0;

  // Get plugin description
  virtual std::string getDescription() const = 0;

  virtual Logger getLogger() {
    if (!logger) {
      auto name = fmt::format("{}:{}", getType(), getName());
      logger = Log::get(name);
    }

    return logger;
  }
};

template <typename T> void Registry::dump() {
  getLogger()->info("Available plugins:");

  for (T *p : lookup<T>())
    getLogger()->info(" - {}: {}", p->getName(), p->getDescription());
}

} // namespace plugin
} // namespace devbind
