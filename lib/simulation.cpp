/* Emulated system described by a configuration file.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>

#include <devbind/exceptions.hpp>
#include <devbind/host/emulation.h>
#include <devbind/kernel/error.hpp>
#include <devbind/simulation.hpp>
#include <devbind/utils.hpp>

using namespace devbind;

Simulation::Simulation()
    : state(State::INITIAL), logger(Log::get("simulation")) {}

Simulation::~Simulation() { stop(); }

void Simulation::parse(json_t *root) {
  int ret;

  json_t *json_logging = nullptr;
  json_t *json_firmware = nullptr;
  json_t *json_modules = nullptr;
  json_t *json_devices = nullptr;

  json_error_t err;

  if (state == State::STARTED)
    throw RuntimeError("Can not parse configuration of a running simulation");

  ret = json_unpack_ex(root, &err, 0, "{ s?: o, s?: o, s?: o, s?: o }",
                       "logging", &json_logging, "firmware", &json_firmware,
                       "modules", &json_modules, "devices", &json_devices);
  if (ret)
    throw ConfigError(root, err, "config", "Unpacking top-level config failed");

  if (json_logging)
    Log::getInstance().parse(json_logging);

  if (json_firmware)
    parseFirmware(json_firmware);

  if (json_modules)
    parseModules(json_modules);

  if (json_devices) {
    if (!json_is_array(json_devices))
      throw ConfigError(json_devices, "config-devices",
                        "Setting 'devices' must be a list of objects");

    size_t i;
    json_t *json_device;
    json_array_foreach(json_devices, i, json_device) parseDevice(json_device);
  }

  state = State::PARSED;
}

void Simulation::parseFirmware(json_t *json) {
  int ret;

  json_t *json_search_paths = nullptr;
  json_t *json_builtin = nullptr;

  json_error_t err;

  ret = json_unpack_ex(json, &err, JSON_STRICT, "{ s?: o, s?: o }",
                       "search_paths", &json_search_paths, "builtin",
                       &json_builtin);
  if (ret)
    throw ConfigError(json, err, "config-firmware");

  if (json_search_paths) {
    if (!json_is_array(json_search_paths))
      throw ConfigError(json_search_paths, "config-firmware-search-paths",
                        "Setting 'search_paths' must be a list of strings");

    searchPaths.clear();

    size_t i;
    json_t *json_path;
    json_array_foreach(json_search_paths, i, json_path) {
      if (!json_is_string(json_path))
        throw ConfigError(json_path, "config-firmware-search-paths",
                          "Firmware search paths must be strings");

      std::string path = json_string_value(json_path);
      if (path.find(':') != std::string::npos)
        throw ConfigError(json_path, "config-firmware-search-paths",
                          "Invalid firmware search path: {}", path);

      searchPaths.push_back(path);
    }
  }

  if (json_builtin) {
    if (!json_is_object(json_builtin))
      throw ConfigError(json_builtin, "config-firmware-builtin",
                        "Setting 'builtin' must be a group of name => "
                        "contents mappings");

    const char *name;
    json_t *json_contents;
    json_object_foreach(json_builtin, name, json_contents) {
      std::string contents;

      if (json_is_string(json_contents))
        contents.assign(json_string_value(json_contents),
                        json_string_length(json_contents));
      else if (json_is_array(json_contents)) {
        size_t i;
        json_t *json_byte;
        json_array_foreach(json_contents, i, json_byte) {
          json_int_t byte =
              json_is_integer(json_byte) ? json_integer_value(json_byte) : -1;
          if (byte < 0 || byte > 0xff)
            throw ConfigError(json_byte, "config-firmware-builtin",
                              "Invalid byte in built-in firmware {}", name);

          contents.push_back(static_cast<char>(byte));
        }
      } else
        throw ConfigError(json_contents, "config-firmware-builtin",
                          "Contents of built-in firmware {} must be a string "
                          "or a list of bytes",
                          name);

      builtinFirmware[name] = contents;
    }
  }
}

void Simulation::parseModules(json_t *json) {
  if (!json_is_array(json))
    throw ConfigError(json, "config-modules",
                      "Setting 'modules' must be a list of module names");

  size_t i;
  json_t *json_module;
  json_array_foreach(json, i, json_module) {
    if (!json_is_string(json_module))
      throw ConfigError(json_module, "config-modules",
                        "Module names must be strings");

    moduleNames.push_back(json_string_value(json_module));
  }
}

void Simulation::parseDevice(json_t *json) {
  int ret;

  const char *bus;
  const char *name = nullptr;
  const char *compatible = nullptr;

  json_int_t address = -1;
  json_int_t id = PLATFORM_DEVID_NONE;
  int tenBit = 0;

  json_error_t err;

  ret = json_unpack_ex(json, &err, 0, "{ s: s }", "bus", &bus);
  if (ret)
    throw ConfigError(json, err, "config-devices", "Failed to parse bus type");

  DeviceConfig dc = {};

  if (!strcmp(bus, "i2c")) {
    ret = json_unpack_ex(json, &err, JSON_STRICT,
                         "{ s: s, s: s, s: I, s?: s, s?: b }", "bus", &bus,
                         "type", &name, "address", &address, "compatible",
                         &compatible, "ten_bit", &tenBit);
    if (ret)
      throw ConfigError(json, err, "config-devices-i2c",
                        "Failed to parse I2C device");

    if (strlen(name) >= I2C_NAME_SIZE)
      throw ConfigError(json, "config-devices-i2c",
                        "I2C device type is too long: {}", name);

    if (address < 0 || address > 0x3ff)
      throw ConfigError(json, "config-devices-i2c",
                        "Invalid I2C address: {}", address);

    dc.bus = Bus::I2C;
    dc.address = static_cast<unsigned short>(address);
    dc.tenBit = tenBit;
  } else if (!strcmp(bus, "platform")) {
    ret = json_unpack_ex(json, &err, JSON_STRICT, "{ s: s, s: s, s?: I, s?: s }",
                         "bus", &bus, "name", &name, "id", &id, "compatible",
                         &compatible);
    if (ret)
      throw ConfigError(json, err, "config-devices-platform",
                        "Failed to parse platform device");

    if (strlen(name) >= PLATFORM_NAME_SIZE)
      throw ConfigError(json, "config-devices-platform",
                        "Platform device name is too long: {}", name);

    dc.bus = Bus::PLATFORM;
    dc.id = static_cast<int>(id);
  } else
    throw ConfigError(json, "config-devices", "Unknown bus type: {}", bus);

  dc.name = name;
  if (compatible)
    dc.compatible = compatible;

  deviceConfigs.push_back(dc);
}

void Simulation::start() {
  int ret;

  if (state != State::PARSED)
    throw RuntimeError("Simulation must be parsed before it is started");

  if (!searchPaths.empty()) {
    std::string paths;
    for (auto &p : searchPaths)
      paths += (paths.empty() ? "" : ":") + p;

    kernel::toResult(emu_firmware_set_search_path(paths.c_str()));
  }

  for (auto &fw : builtinFirmware) {
    ret = emu_firmware_add_builtin(
        fw.first.c_str(), reinterpret_cast<const uint8_t *>(fw.second.data()),
        fw.second.size());
    if (ret)
      throw kernel::Error(ret, "Failed to add built-in firmware {}", fw.first);
  }

  state = State::STARTED;

  try {
    for (auto &name : moduleNames)
      modules.push_back(kernel::ModuleFactory::load(name));

    for (auto &dc : deviceConfigs) {
      const char *compat =
          dc.compatible.empty() ? nullptr : dc.compatible.c_str();

      if (dc.bus == Bus::I2C) {
        struct i2c_board_info info = {};

        if (!utils::copyName(info.type, sizeof(info.type), dc.name))
          throw RuntimeError("I2C device type is too long: {}", dc.name);

        info.addr = dc.address;
        info.flags = dc.tenBit ? I2C_CLIENT_TEN : 0;
        info.of_compatible = compat;

        auto *client =
            kernel::fromErrPtr(i2c_new_client_device(nullptr, &info));
        clients.push_back(client);
      } else {
        auto *pdev = kernel::fromErrPtr(
            platform_device_register_simple(dc.name.c_str(), dc.id, compat));
        platformDevices.push_back(pdev);
      }
    }
  } catch (...) {
    stop();
    throw;
  }

  logger->info("Started with {} modules and {} devices", modules.size(),
               clients.size() + platformDevices.size());
}

void Simulation::stop() {
  if (state != State::STARTED)
    return;

  while (!clients.empty()) {
    i2c_unregister_device(clients.back());
    clients.pop_back();
  }

  while (!platformDevices.empty()) {
    platform_device_unregister(platformDevices.back());
    platformDevices.pop_back();
  }

  while (!modules.empty())
    modules.pop_back();

  state = State::PARSED;

  logger->info("Stopped");
}

void Simulation::dump() {
  auto report = [this](struct device *dev) {
    logger->info(" - {}: {}", dev_name(dev),
                 dev->driver ? dev->driver->name : "unbound");
  };

  logger->info("Devices:");

  for (auto *c : clients)
    report(&c->dev);

  for (auto *p : platformDevices)
    report(&p->dev);

  logger->info("Real time clocks:");

  for (int i = 0;; i++) {
    auto *rtc = rtc_class_open(fmt::format("rtc{}", i).c_str());
    if (!rtc)
      break;

    struct rtc_time tm;
    int ret = rtc_read_time(rtc, &tm);
    if (ret)
      logger->warn(" - rtc{}: failed to read time: {}", i, ret);
    else
      logger->info(" - rtc{}: {:04}-{:02}-{:02} {:02}:{:02}:{:02}", i,
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                   tm.tm_min, tm.tm_sec);

    rtc_class_close(rtc);
  }
}
