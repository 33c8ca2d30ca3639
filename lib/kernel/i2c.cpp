/* I2C client drivers.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>

#include <devbind/kernel/i2c.hpp>

using namespace devbind::kernel::i2c;

DeviceId::RawType DeviceId::toRawId(ptrdiff_t offset) const {
  RawType raw{};

  memcpy(raw.name, name, sizeof(raw.name));
  raw.driver_data = static_cast<kernel_ulong_t>(offset);

  return raw;
}
