/* Generic device references.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <devbind/host/bindings.h>

namespace devbind {
namespace kernel {
namespace device {

// Anything which is backed by a host `struct device`.
class RawDevice {

public:
  virtual ~RawDevice() {}

  // The returned pointer is valid at least as long as this object.
  virtual struct ::device *rawDevice() const = 0;

  std::string name() const;
};

// A reference counted handle of a host device.
//
// In contrast to the per-callback handles of the bus drivers, this handle may
// be retained beyond a callback. Each instance owns one reference.
class Device : public RawDevice {

protected:
  struct ::device *dev;

  explicit Device(struct ::device *d) : dev(d) {}

public:
  // Take a new reference to dev.
  static Device fromRaw(struct ::device *dev);

  explicit Device(const RawDevice &other) : Device(fromRaw(other.rawDevice())) {}

  Device(const Device &other);
  Device(Device &&other) noexcept;

  Device &operator=(Device other) noexcept;

  ~Device() override;

  struct ::device *rawDevice() const override { return dev; }
};

} // namespace device
} // namespace kernel
} // namespace devbind
