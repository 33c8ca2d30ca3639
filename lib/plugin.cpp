/* Loadable / plugin support.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <devbind/plugin.hpp>

using namespace devbind::plugin;

Registry *devbind::plugin::registry = nullptr;

Plugin::Plugin() {
  if (registry == nullptr)
    registry = new Registry();

  registry->add(this);
}

Plugin::~Plugin() { registry->remove(this); }

void Plugin::dump() {
  getLogger()->info("Name: '{}' Description: '{}'", getName(),
                    getDescription());
}
