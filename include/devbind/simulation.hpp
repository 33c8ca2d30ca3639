/* Emulated system described by a configuration file.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <list>
#include <map>
#include <memory>
#include <string>

#include <jansson.h>

#include <devbind/host/bindings.h>
#include <devbind/kernel/module.hpp>
#include <devbind/log.hpp>

namespace devbind {

class Simulation {

public:
  enum class Bus { I2C, PLATFORM };

  struct DeviceConfig {
    Bus bus;
    std::string name; // I2C device type or platform device name
    std::string compatible;

    unsigned short address; // I2C only
    bool tenBit;            // I2C only
    int id;                 // Platform only
  };

  enum class State { INITIAL, PARSED, STARTED };

protected:
  State state;

  Logger logger;

  std::list<std::string> searchPaths;
  std::map<std::string, std::string> builtinFirmware;
  std::list<std::string> moduleNames;
  std::list<DeviceConfig> deviceConfigs;

  std::list<std::unique_ptr<kernel::Module>> modules;
  std::list<struct i2c_client *> clients;
  std::list<struct platform_device *> platformDevices;

  void parseFirmware(json_t *json);
  void parseModules(json_t *json);
  void parseDevice(json_t *json);

public:
  Simulation();

  ~Simulation();

  Simulation(const Simulation &) = delete;
  Simulation &operator=(const Simulation &) = delete;

  void parse(json_t *root);

  // Load modules and instantiate devices.
  void start();

  // Remove devices and unload modules in reverse order.
  void stop();

  // Print the current bindings and registered RTCs.
  void dump();

  State getState() const { return state; }

  const std::list<std::string> &getModuleNames() const { return moduleNames; }

  const std::list<DeviceConfig> &getDeviceConfigs() const {
    return deviceConfigs;
  }

  const std::list<struct i2c_client *> &getClients() const { return clients; }

  const std::list<struct platform_device *> &getPlatformDevices() const {
    return platformDevices;
  }
};

} // namespace devbind
