/* Firmware loading.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <new>

#include <devbind/kernel/error.hpp>
#include <devbind/kernel/firmware.hpp>
#include <devbind/log.hpp>

using namespace devbind;
using namespace devbind::kernel;

std::unique_ptr<Firmware> Firmware::request(RequestFunc func,
                                            const std::string &name,
                                            const device::RawDevice &dev) {
  const struct firmware *fw = nullptr;

  int ret = func(&fw, name.c_str(), dev.rawDevice());
  if (ret)
    throw Error(ret, "Failed to load firmware {} for {}", name, dev.name());

  Log::get("kernel:firmware")
      ->debug("Loaded firmware {} for {} ({} bytes)", name, dev.name(),
              fw->size);

  try {
    return std::unique_ptr<Firmware>(new Firmware(fw));
  } catch (const std::bad_alloc &) {
    release_firmware(fw);
    throw;
  }
}

std::unique_ptr<Firmware> Firmware::request(const std::string &name,
                                            const device::RawDevice &dev) {
  return request(request_firmware, name, dev);
}

std::unique_ptr<Firmware>
Firmware::requestNowarn(const std::string &name,
                        const device::RawDevice &dev) {
  return request(firmware_request_nowarn, name, dev);
}

std::unique_ptr<Firmware>
Firmware::requestDirect(const std::string &name,
                        const device::RawDevice &dev) {
  return request(request_firmware_direct, name, dev);
}

Firmware::~Firmware() { release_firmware(fw); }
