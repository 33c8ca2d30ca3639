/* Loadable kernel modules.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <devbind/host/bindings.h>
#include <devbind/kernel/driver.hpp>
#include <devbind/log.hpp>
#include <devbind/plugin.hpp>

namespace devbind {
namespace kernel {

// A loaded module instance.
//
// Everything a module registers with the host is owned by the instance and
// unregistered when it is destroyed.
class Module {

protected:
  std::string name;
  struct module owner;

  Logger logger;

public:
  explicit Module(const std::string &name);

  virtual ~Module();

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  const std::string &getName() const { return name; }

  struct module *getOwner() { return &owner; }
};

class ModuleFactory : public plugin::Plugin {

public:
  using plugin::Plugin::Plugin;

  // Load the module registered under name
  static std::unique_ptr<Module> load(const std::string &name);

  virtual std::string getType() const { return "module"; }

protected:
  virtual std::unique_ptr<Module> make() const = 0;
};

template <typename T, const char *name, const char *desc>
class ModulePlugin : public ModuleFactory {

public:
  virtual std::string getName() const { return name; }

  virtual std::string getDescription() const { return desc; }

protected:
  virtual std::unique_ptr<Module> make() const {
    return std::make_unique<T>(name);
  }
};

namespace driver {

// A module which registers a single driver for its whole lifetime.
//
// A is the bus adapter, e.g. platform::DriverAdapter<MyDriver>. The driver
// is registered under the name of the module.
template <typename A> class Module : public kernel::Module {

protected:
  std::unique_ptr<Registration<A>> registration;

public:
  explicit Module(const std::string &name)
      : kernel::Module(name),
        registration(Registration<A>::create(name, getOwner())) {}
};

} // namespace driver
} // namespace kernel
} // namespace devbind
