/* Unit tests for configured simulations.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <criterion/criterion.h>

#include <jansson.h>

#include <devbind/exceptions.hpp>
#include <devbind/host/emulation.h>
#include <devbind/simulation.hpp>

using namespace devbind;

// cppcheck-suppress unknownMacro
TestSuite(simulation, .description = "Configured simulations");

static const char *config = R"({
  "firmware": {
    "search_paths": [ "/nonexistent" ],
    "builtin": {
      "softrtc-cal.bin": [ 16, 14, 0, 0 ]
    }
  },
  "modules": [ "mlilabs_emc", "softrtc" ],
  "devices": [
    { "bus": "platform", "name": "emc", "compatible": "mlilabs,emc" },
    { "bus": "platform", "name": "unknown", "id": 3 },
    { "bus": "i2c", "type": "softrtc-cal", "address": 104 },
    { "bus": "i2c", "type": "rtc", "address": 81, "compatible": "devbind,softrtc" },
    { "bus": "i2c", "type": "softrtc", "address": 850, "ten_bit": true }
  ]
})";

static json_t *loadConfig(const char *text) {
  json_error_t err;

  auto *json = json_loads(text, 0, &err);
  cr_assert_not_null(json, "%s", err.text);

  return json;
}

Test(simulation, parse) {
  auto *json = loadConfig(config);

  Simulation sim;
  sim.parse(json);

  cr_assert(sim.getState() == Simulation::State::PARSED);
  cr_assert_eq(sim.getModuleNames().size(), 2);
  cr_assert_eq(sim.getDeviceConfigs().size(), 5);

  auto &first = sim.getDeviceConfigs().front();
  cr_assert(first.bus == Simulation::Bus::PLATFORM);
  cr_assert_eq(first.name, "emc");
  cr_assert_eq(first.id, PLATFORM_DEVID_NONE);

  auto &last = sim.getDeviceConfigs().back();
  cr_assert(last.bus == Simulation::Bus::I2C);
  cr_assert_eq(last.address, 850);
  cr_assert(last.tenBit);

  json_decref(json);
}

Test(simulation, unknown_bus) {
  auto *json = loadConfig(R"({ "devices": [ { "bus": "spi", "name": "x" } ] })");

  Simulation sim;

  cr_assert_throw(sim.parse(json), ConfigError);
  cr_assert(sim.getState() == Simulation::State::INITIAL);

  json_decref(json);
}

Test(simulation, invalid_settings) {
  const char *configs[] = {
      R"({ "devices": [ { "bus": "i2c", "type": "x" } ] })",
      R"({ "devices": [ { "bus": "i2c", "type": "x", "address": 4096 } ] })",
      R"({ "devices": [ { "bus": "platform", "name": "x", "foo": 1 } ] })",
      R"({ "devices": { "bus": "platform" } })",
      R"({ "modules": [ 1 ] })",
      R"({ "firmware": { "builtin": { "a.bin": [ 256 ] } } })",
      R"({ "firmware": { "search_paths": [ "/a:/b" ] } })",
  };

  for (auto *c : configs) {
    auto *json = loadConfig(c);

    Simulation sim;
    cr_assert_throw(sim.parse(json), ConfigError, "%s", c);

    json_decref(json);
  }
}

Test(simulation, start_stop) {
  auto *json = loadConfig(config);

  Simulation sim;
  sim.parse(json);
  sim.start();

  cr_assert(sim.getState() == Simulation::State::STARTED);
  cr_assert_eq(sim.getClients().size(), 3);
  cr_assert_eq(sim.getPlatformDevices().size(), 2);

  // All but the platform device without a driver
  cr_assert_eq(emu_bound_devices(), 4);

  auto *rtc = rtc_class_open("rtc2");
  cr_assert_not_null(rtc);
  rtc_class_close(rtc);

  sim.dump();
  sim.stop();

  cr_assert(sim.getState() == Simulation::State::PARSED);
  cr_assert_eq(emu_bound_devices(), 0);
  cr_assert_null(rtc_class_open("rtc0"));

  json_decref(json);
}

Test(simulation, start_failure) {
  auto *json = loadConfig(R"({
    "modules": [ "softrtc" ],
    "devices": [
      { "bus": "i2c", "type": "softrtc", "address": 16 },
      { "bus": "i2c", "type": "softrtc", "address": 16 }
    ]
  })");

  Simulation sim;
  sim.parse(json);

  // The second device collides with the first one
  cr_assert_throw(sim.start(), kernel::Error);

  cr_assert(sim.getState() == Simulation::State::PARSED);
  cr_assert_eq(emu_bound_devices(), 0);
  cr_assert_eq(sim.getClients().size(), 0);

  json_decref(json);
}

Test(simulation, start_unparsed) {
  Simulation sim;

  cr_assert_throw(sim.start(), RuntimeError);
}

Test(simulation, logging) {
  auto *json = loadConfig(R"({
    "logging": {
      "level": "warning",
      "expressions": [ { "name": "host:*", "level": "debug" } ]
    }
  })");

  Simulation sim;
  sim.parse(json);

  cr_assert_eq(Log::getInstance().getLevel(), Log::Level::warn);
  cr_assert_eq(Log::get("host:test")->level(), Log::Level::debug);
  cr_assert_eq(Log::get("other")->level(), Log::Level::warn);

  json_decref(json);
}
