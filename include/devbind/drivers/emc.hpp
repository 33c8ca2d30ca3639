/* MLI-Labs Embedded Management Controller (EMC) driver.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <devbind/kernel/driver.hpp>
#include <devbind/kernel/of.hpp>
#include <devbind/kernel/platform.hpp>

namespace devbind {
namespace drivers {

class EmcDriver : public kernel::platform::Driver {

public:
  static const kernel::driver::IdArray<kernel::of::DeviceId, IdInfo, 1>
      ofIdTable;

  static Data probe(kernel::platform::Device &pdev, const IdInfo *info);
};

} // namespace drivers
} // namespace devbind
