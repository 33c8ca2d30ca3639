/* MLI-Labs Embedded Management Controller (EMC) driver.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <devbind/drivers/emc.hpp>
#include <devbind/kernel/module.hpp>
#include <devbind/log.hpp>

using namespace devbind;
using namespace devbind::drivers;
using namespace devbind::kernel;

const driver::IdArray<of::DeviceId, EmcDriver::IdInfo, 1>
    EmcDriver::ofIdTable = {{
        {"mlilabs,emc"},
    }};

EmcDriver::Data EmcDriver::probe(platform::Device &pdev, const IdInfo *) {
  Log::get("driver:mlilabs_emc")->info("Probed {}", pdev.name());

  return {};
}

static char n[] = "mlilabs_emc";
static char d[] = "MLI-Labs Embedded Management Controller";
static ModulePlugin<driver::Module<platform::DriverAdapter<EmcDriver>>, n, d>
    p;
