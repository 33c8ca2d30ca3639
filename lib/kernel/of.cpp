/* Open Firmware (device tree) matching.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>

#include <devbind/kernel/of.hpp>

using namespace devbind::kernel::of;

DeviceId::RawType DeviceId::toRawId(ptrdiff_t offset) const {
  RawType raw{};

  memcpy(raw.compatible, compatible, sizeof(raw.compatible));
  raw.data = reinterpret_cast<const void *>(static_cast<intptr_t>(offset));

  return raw;
}
