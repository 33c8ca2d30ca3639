/* Generic device references.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <utility>

#include <devbind/kernel/device.hpp>
#include <devbind/kernel/error.hpp>

using namespace devbind::kernel::device;

std::string RawDevice::name() const {
  const char *n = dev_name(rawDevice());

  return n ? n : "";
}

Device Device::fromRaw(struct ::device *dev) {
  if (!dev)
    throw Error(EINVAL, "Cannot reference a null device");

  return Device(get_device(dev));
}

Device::Device(const Device &other) : dev(get_device(other.dev)) {}

Device::Device(Device &&other) noexcept : dev(other.dev) {
  other.dev = nullptr;
}

Device &Device::operator=(Device other) noexcept {
  std::swap(dev, other.dev);

  return *this;
}

Device::~Device() {
  if (dev)
    put_device(dev);
}
