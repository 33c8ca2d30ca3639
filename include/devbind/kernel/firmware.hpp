/* Firmware loading.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <devbind/host/bindings.h>
#include <devbind/kernel/device.hpp>
#include <devbind/kernel/types.hpp>

namespace devbind {
namespace kernel {

// A firmware blob loaded by the host.
//
// The blob is released when the object is destroyed.
class Firmware {

protected:
  const struct firmware *fw;

  explicit Firmware(const struct firmware *f) : fw(f) {}

  using RequestFunc = int (*)(const struct firmware **, const char *,
                              struct ::device *);

  static std::unique_ptr<Firmware> request(RequestFunc func,
                                           const std::string &name,
                                           const device::RawDevice &dev);

public:
  // Load a firmware, falling back to the built-in store.
  static std::unique_ptr<Firmware> request(const std::string &name,
                                           const device::RawDevice &dev);

  // Same as request() but does not warn if the firmware is missing.
  static std::unique_ptr<Firmware> requestNowarn(const std::string &name,
                                                 const device::RawDevice &dev);

  // Load a firmware from the search path only, without any fallback.
  static std::unique_ptr<Firmware> requestDirect(const std::string &name,
                                                 const device::RawDevice &dev);

  Firmware(const Firmware &) = delete;
  Firmware &operator=(const Firmware &) = delete;

  ~Firmware();

  ByteView data() const { return ByteView(fw->data, fw->size); }

  size_t size() const { return fw->size; }
};

} // namespace kernel
} // namespace devbind
