/* Unit tests for platform drivers and modules.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <criterion/criterion.h>

#include <devbind/exceptions.hpp>
#include <devbind/host/emulation.h>
#include <devbind/kernel/module.hpp>
#include <devbind/kernel/platform.hpp>

#include "helpers.hpp"

using namespace devbind;
using namespace devbind::kernel;

// cppcheck-suppress unknownMacro
TestSuite(platform, .description = "Platform drivers and loadable modules");

static bool supplierReady;
static int deferrals;
static int devresRuns;
static int fallbackProbes;

struct SupplierDriver : public platform::Driver {
  static Data probe(platform::Device &, const IdInfo *) {
    supplierReady = true;

    return {};
  }

  static void remove(Data &) { supplierReady = false; }
};

struct ConsumerDriver : public platform::Driver {
  static Data probe(platform::Device &, const IdInfo *) {
    if (!supplierReady) {
      deferrals++;
      throw Error(EPROBE_DEFER);
    }

    return {};
  }
};

static void countDevres(void *) { devresRuns++; }

// Withdraws one of two managed resources and then fails
struct WithdrawingDriver : public platform::Driver {
  static Data probe(platform::Device &pdev, const IdInfo *) {
    toResult(devm_add_action(pdev.rawDevice(), countDevres, nullptr));
    toResult(devm_add_action(pdev.rawDevice(), countDevres, &devresRuns));

    devm_remove_action(pdev.rawDevice(), countDevres, &devresRuns);

    throw Error(EIO);
  }
};

// Acquires a managed resource and then fails
struct FailingDriver : public platform::Driver {
  static const driver::IdArray<of::DeviceId, IdInfo, 1> ofIdTable;

  static Data probe(platform::Device &pdev, const IdInfo *) {
    toResult(devm_add_action(pdev.rawDevice(), countDevres, nullptr));

    throw Error(ENODEV, "No such hardware");
  }
};

const driver::IdArray<of::DeviceId, FailingDriver::IdInfo, 1>
    FailingDriver::ofIdTable = {{
        {"vendor,multi"},
    }};

struct FallbackDriver : public platform::Driver {
  static const driver::IdArray<of::DeviceId, IdInfo, 1> ofIdTable;

  static Data probe(platform::Device &, const IdInfo *) {
    fallbackProbes++;

    return {};
  }
};

const driver::IdArray<of::DeviceId, FallbackDriver::IdInfo, 1>
    FallbackDriver::ofIdTable = {{
        {"vendor,multi"},
    }};

template <typename T>
using Registration = driver::Registration<platform::DriverAdapter<T>>;

Test(platform, module_compatible) {
  auto module = ModuleFactory::load("mlilabs_emc");

  cr_assert_eq(module->getName(), "mlilabs_emc");

  auto *pdev = platform_device_register_simple("board", PLATFORM_DEVID_NONE,
                                               "mlilabs,emc");
  cr_assert_not(IS_ERR(pdev));
  cr_assert_str_eq(dev_name(&pdev->dev), "board");

  cr_assert_eq(emu_bound_devices(), 1);
  cr_assert_not_null(pdev->dev.driver);
  cr_assert_str_eq(pdev->dev.driver->owner->name, "mlilabs_emc");

  // Unloading the module unbinds the device
  module.reset();

  cr_assert_eq(emu_bound_devices(), 0);
  cr_assert_null(pdev->dev.driver);

  platform_device_unregister(pdev);
}

Test(platform, module_name_fallback) {
  auto *pdev = platform_device_register_simple("mlilabs_emc", 0, nullptr);
  cr_assert_not(IS_ERR(pdev));
  cr_assert_str_eq(dev_name(&pdev->dev), "mlilabs_emc.0");

  cr_assert_eq(emu_bound_devices(), 0);

  auto module = ModuleFactory::load("mlilabs_emc");

  cr_assert_eq(emu_bound_devices(), 1);

  platform_device_unregister(pdev);

  cr_assert_eq(emu_bound_devices(), 0);
}

Test(platform, module_unknown) {
  cr_assert_throw(ModuleFactory::load("no-such-module"), RuntimeError);
}

Test(platform, module_register_fault) {
  emu_inject_fault("__platform_driver_register", -ENOMEM);

  int err = catchErrno([] { ModuleFactory::load("mlilabs_emc"); });

  cr_assert_eq(err, ENOMEM);
}

Test(platform, duplicate_device) {
  auto *a = platform_device_register_simple("dup", 1, nullptr);
  cr_assert_not(IS_ERR(a));

  auto *b = platform_device_register_simple("dup", 1, nullptr);
  cr_assert(IS_ERR(b));
  cr_assert_eq(PTR_ERR(b), -EEXIST);

  platform_device_unregister(a);
}

Test(platform, deferred_probe) {
  auto consumer = Registration<ConsumerDriver>::create("consumer", nullptr);

  auto *c = platform_device_register_simple("consumer", PLATFORM_DEVID_NONE,
                                            nullptr);
  cr_assert_not(IS_ERR(c));

  cr_assert_eq(emu_bound_devices(), 0);
  cr_assert_eq(emu_deferred_devices(), 1);
  cr_assert_eq(deferrals, 1);

  auto supplier = Registration<SupplierDriver>::create("supplier", nullptr);

  auto *s = platform_device_register_simple("supplier", PLATFORM_DEVID_NONE,
                                            nullptr);
  cr_assert_not(IS_ERR(s));

  // Binding the supplier retries the consumer
  cr_assert_eq(emu_bound_devices(), 2);
  cr_assert_eq(emu_deferred_devices(), 0);
  cr_assert_not_null(c->dev.driver);

  platform_device_unregister(c);
  platform_device_unregister(s);

  cr_assert_eq(emu_bound_devices(), 0);
}

Test(platform, failed_probe_tries_next_driver) {
  auto failing = Registration<FailingDriver>::create("failing", nullptr);
  auto fallback = Registration<FallbackDriver>::create("fallback", nullptr);

  auto *pdev = platform_device_register_simple("multi", PLATFORM_DEVID_NONE,
                                               "vendor,multi");
  cr_assert_not(IS_ERR(pdev));

  // Resources of the failed probe have been released
  cr_assert_eq(devresRuns, 1);
  cr_assert_eq(fallbackProbes, 1);
  cr_assert_eq(emu_bound_devices(), 1);
  cr_assert_str_eq(pdev->dev.driver->name, "fallback");

  platform_device_unregister(pdev);

  cr_assert_eq(devresRuns, 1);
}

Test(platform, withdrawn_devres) {
  auto reg = Registration<WithdrawingDriver>::create("withdraw", nullptr);

  auto *pdev = platform_device_register_simple("withdraw", PLATFORM_DEVID_NONE,
                                               nullptr);
  cr_assert_not(IS_ERR(pdev));

  cr_assert_eq(emu_bound_devices(), 0);
  cr_assert_eq(devresRuns, 1);

  platform_device_unregister(pdev);
}
