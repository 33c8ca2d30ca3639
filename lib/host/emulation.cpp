/* Fault injection of the emulated host.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <map>
#include <mutex>
#include <new>
#include <set>
#include <string>

#include <devbind/host/emulation.h>

#include "core.hpp"

using namespace devbind;

static std::mutex faultsLock;
static std::map<std::string, int> faults;

// Entry points which support fault injection
static const std::set<std::string> faultable = {
    "device_add",
    "driver_register",
    "devm_add_action",
    "i2c_register_driver",
    "i2c_new_client_device",
    "__platform_driver_register",
    "platform_device_register_simple",
    "devm_rtc_allocate_device",
    "devm_rtc_register_device",
    "request_firmware",
    "firmware_request_nowarn",
    "request_firmware_direct",
};

int devbind::host::consumeFault(const char *function) {
  std::lock_guard<std::mutex> guard(faultsLock);

  auto it = faults.find(function);
  if (it == faults.end())
    return 0;

  int error = it->second;
  faults.erase(it);

  Log::get("host:emulation")->debug("Injecting error {} into {}", error,
                                    function);

  return error;
}

int emu_inject_fault(const char *function, int error) {
  if (!function || error >= 0 || !faultable.count(function))
    return -EINVAL;

  try {
    std::lock_guard<std::mutex> guard(faultsLock);

    faults[function] = error;
  } catch (const std::bad_alloc &) {
    return -ENOMEM;
  }

  return 0;
}

void emu_clear_faults(void) {
  std::lock_guard<std::mutex> guard(faultsLock);

  faults.clear();
}
