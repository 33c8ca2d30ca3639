/* Loadable kernel modules.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <devbind/exceptions.hpp>
#include <devbind/kernel/module.hpp>

using namespace devbind;
using namespace devbind::kernel;

Module::Module(const std::string &nme)
    : name(nme), owner{}, logger(Log::get("module:" + nme)) {
  owner.name = name.c_str();

  logger->info("Loading module");
}

Module::~Module() { logger->info("Unloading module"); }

std::unique_ptr<Module> ModuleFactory::load(const std::string &name) {
  if (!plugin::registry)
    throw RuntimeError("No modules available");

  auto *factory = plugin::registry->lookup<ModuleFactory>(name);
  if (!factory)
    throw RuntimeError("Unknown module: {}", name);

  return factory->make();
}
