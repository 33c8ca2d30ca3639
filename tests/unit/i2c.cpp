/* Unit tests for I2C drivers.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <criterion/criterion.h>

#include <memory>

#include <devbind/host/emulation.h>
#include <devbind/kernel/i2c.hpp>

#include "helpers.hpp"

using namespace devbind::kernel;

// cppcheck-suppress unknownMacro
TestSuite(i2c, .description = "I2C driver registration and binding");

static int constructed;
static int dropped;
static int removed;
static int hooked;
static int lastIdInfo;

struct TestData {
  unsigned short addr;
  int idInfo;

  TestData(unsigned short a, int i) : addr(a), idInfo(i) { constructed++; }

  ~TestData() { dropped++; }

  void deviceRemove() { hooked++; }
};

struct TestDriver : public i2c::Driver {
  using Data = std::unique_ptr<TestData>;
  using DeviceIdInfo = int;

  static const driver::IdArray<i2c::DeviceId, int, 3> idTable;

  static Data probe(i2c::Client &client, const IdInfo *,
                    const DeviceIdInfo *idInfo) {
    // Address reserved for probe failures
    if (client.addr() == 0x66)
      throw Error(EIO, "Simulated probe failure");

    lastIdInfo = idInfo ? *idInfo : -1;

    return std::make_unique<TestData>(client.addr(), lastIdInfo);
  }

  static void remove(Data &data) {
    removed++;

    // Address reserved for remove failures
    if (data->addr == 0x67)
      throw Error(EBUSY, "Simulated remove failure");
  }
};

const driver::IdArray<i2c::DeviceId, int, 3> TestDriver::idTable = {{
    {"dev-a", 10},
    {"dev-b"},
    {"dev-busy", 42},
}};

using Registration = driver::Registration<i2c::DriverAdapter<TestDriver>>;

static int ofInfo;
static int ofIdInfo;

struct OfDriver : public i2c::Driver {
  using IdInfo = int;
  using DeviceIdInfo = int;

  static const driver::IdArray<of::DeviceId, int, 1> ofIdTable;
  static const driver::IdArray<i2c::DeviceId, int, 1> idTable;

  static Data probe(i2c::Client &, const IdInfo *info,
                    const DeviceIdInfo *idInfo) {
    ofInfo = info ? *info : -1;
    ofIdInfo = idInfo ? *idInfo : -1;

    return {};
  }
};

const driver::IdArray<of::DeviceId, int, 1> OfDriver::ofIdTable = {{
    {"vendor,chip", 1},
}};

const driver::IdArray<i2c::DeviceId, int, 1> OfDriver::idTable = {{
    {"chip", 2},
}};

Test(i2c, bind_unbind) {
  auto reg = Registration::create("test-i2c", nullptr);

  cr_assert(reg->isRegistered());

  auto *client = newClient("dev-a", 0x10);
  cr_assert_not(IS_ERR(client));

  cr_assert_eq(emu_bound_devices(), 1);
  cr_assert_eq(constructed, 1);
  cr_assert_eq(lastIdInfo, 10);

  auto *data = static_cast<TestData *>(i2c_get_clientdata(client));
  cr_assert_not_null(data);
  cr_assert_eq(data->addr, 0x10);

  i2c_unregister_device(client);

  cr_assert_eq(emu_bound_devices(), 0);
  cr_assert_eq(removed, 1);
  cr_assert_eq(hooked, 1);
  cr_assert_eq(dropped, 1);
}

Test(i2c, entry_without_info) {
  auto reg = Registration::create("test-i2c", nullptr);

  auto *client = newClient("dev-b", 0x11);
  cr_assert_not(IS_ERR(client));

  cr_assert_eq(emu_bound_devices(), 1);
  cr_assert_eq(lastIdInfo, -1);

  i2c_unregister_device(client);
}

Test(i2c, unrelated_name) {
  auto reg = Registration::create("test-i2c", nullptr);

  auto *client = newClient("unrelated", 0x12);
  cr_assert_not(IS_ERR(client));

  cr_assert_eq(emu_bound_devices(), 0);
  cr_assert_eq(constructed, 0);
  cr_assert_null(i2c_get_clientdata(client));

  i2c_unregister_device(client);

  cr_assert_eq(removed, 0);
}

Test(i2c, probe_failure) {
  auto reg = Registration::create("test-i2c", nullptr);

  auto *client = newClient("dev-a", 0x66);
  cr_assert_not(IS_ERR(client));

  cr_assert_eq(emu_bound_devices(), 0);
  cr_assert_null(client->dev.driver);
  cr_assert_null(i2c_get_clientdata(client));
  cr_assert_eq(constructed, 0);

  i2c_unregister_device(client);

  cr_assert_eq(removed, 0);
  cr_assert_eq(dropped, 0);
}

Test(i2c, remove_failure) {
  auto reg = Registration::create("test-i2c", nullptr);

  auto *client = newClient("dev-busy", 0x67);
  cr_assert_not(IS_ERR(client));

  cr_assert_eq(emu_bound_devices(), 1);
  cr_assert_eq(lastIdInfo, 42);

  i2c_unregister_device(client);

  // The device is finalized regardless
  cr_assert_eq(emu_bound_devices(), 0);
  cr_assert_eq(removed, 1);
  cr_assert_eq(hooked, 1);
  cr_assert_eq(dropped, 1);
}

Test(i2c, register_fault) {
  emu_inject_fault("i2c_register_driver", -ENOMEM);

  int err = catchErrno([] { Registration::create("test-i2c", nullptr); });

  cr_assert_eq(err, ENOMEM);

  // The fault is consumed by the first call
  auto reg = Registration::create("test-i2c", nullptr);
  cr_assert(reg->isRegistered());
}

Test(i2c, clear_faults) {
  cr_assert_eq(emu_inject_fault("i2c_register_driver", -EIO), 0);
  cr_assert_eq(emu_inject_fault("no_such_function", -EIO), -EINVAL);
  cr_assert_eq(emu_inject_fault("i2c_register_driver", 0), -EINVAL);

  emu_clear_faults();

  auto reg = Registration::create("test-i2c", nullptr);
  cr_assert(reg->isRegistered());
}

Test(i2c, register_twice) {
  auto reg = Registration::create("test-i2c", nullptr);

  int err = catchErrno([&reg] { reg->registerDriver("other", nullptr); });

  cr_assert_eq(err, EINVAL);
  cr_assert(reg->isRegistered());
  cr_assert_eq(reg->getName(), "test-i2c");
}

Test(i2c, duplicate_driver_name) {
  auto reg = Registration::create("test-i2c", nullptr);

  int err = catchErrno([] { Registration::create("test-i2c", nullptr); });

  cr_assert_eq(err, EBUSY);
}

Test(i2c, destroy_registration_unbinds) {
  auto reg = Registration::create("test-i2c", nullptr);

  auto *a = newClient("dev-a", 0x20);
  auto *b = newClient("dev-b", 0x21);
  cr_assert_not(IS_ERR(a));
  cr_assert_not(IS_ERR(b));

  cr_assert_eq(emu_bound_devices(), 2);

  reg.reset();

  cr_assert_eq(emu_bound_devices(), 0);
  cr_assert_eq(removed, 2);
  cr_assert_eq(hooked, 2);
  cr_assert_eq(dropped, 2);
  cr_assert_null(i2c_get_clientdata(a));
  cr_assert_null(i2c_get_clientdata(b));

  i2c_unregister_device(a);
  i2c_unregister_device(b);

  cr_assert_eq(removed, 2);
}

Test(i2c, device_before_driver) {
  auto *client = newClient("dev-a", 0x30);
  cr_assert_not(IS_ERR(client));

  cr_assert_eq(emu_bound_devices(), 0);

  auto reg = Registration::create("test-i2c", nullptr);

  cr_assert_eq(emu_bound_devices(), 1);
  cr_assert_eq(constructed, 1);

  i2c_unregister_device(client);

  cr_assert_eq(dropped, 1);
}

Test(i2c, address_validation) {
  auto *client = newClient("dev-a", 0x80);
  cr_assert(IS_ERR(client));
  cr_assert_eq(PTR_ERR(client), -EINVAL);

  client = newClient("dev-a", 0x00);
  cr_assert(IS_ERR(client));
  cr_assert_eq(PTR_ERR(client), -EINVAL);

  client = newClient("dev-a", 0x400, nullptr, I2C_CLIENT_TEN);
  cr_assert(IS_ERR(client));
  cr_assert_eq(PTR_ERR(client), -EINVAL);

  auto *ten = newClient("dev-a", 0x3ff, nullptr, I2C_CLIENT_TEN);
  cr_assert_not(IS_ERR(ten));
  cr_assert_str_eq(dev_name(&ten->dev), "0-a3ff");

  auto *seven = newClient("dev-a", 0x50);
  cr_assert_not(IS_ERR(seven));
  cr_assert_str_eq(dev_name(&seven->dev), "0-0050");

  // Same address but in the 10-bit space
  auto *other = newClient("dev-a", 0x50, nullptr, I2C_CLIENT_TEN);
  cr_assert_not(IS_ERR(other));

  client = newClient("dev-b", 0x50);
  cr_assert(IS_ERR(client));
  cr_assert_eq(PTR_ERR(client), -EBUSY);

  i2c_unregister_device(seven);

  // Free again
  client = newClient("dev-b", 0x50);
  cr_assert_not(IS_ERR(client));

  i2c_unregister_device(client);
  i2c_unregister_device(other);
  i2c_unregister_device(ten);
}

Test(i2c, add_fault) {
  emu_inject_fault("device_add", -EIO);

  auto *client = newClient("dev-a", 0x40);
  cr_assert(IS_ERR(client));
  cr_assert_eq(PTR_ERR(client), -EIO);

  // The address has been given back
  client = newClient("dev-a", 0x40);
  cr_assert_not(IS_ERR(client));

  i2c_unregister_device(client);
}

Test(i2c, of_precedence) {
  auto reg = driver::Registration<i2c::DriverAdapter<OfDriver>>::create(
      "test-of", nullptr);

  auto *client = newClient("chip", 0x10, "vendor,chip");
  cr_assert_not(IS_ERR(client));

  cr_assert_eq(emu_bound_devices(), 1);
  cr_assert_eq(ofInfo, 1);
  cr_assert_eq(ofIdInfo, 2);

  i2c_unregister_device(client);

  client = newClient("chip", 0x11);
  cr_assert_not(IS_ERR(client));

  cr_assert_eq(emu_bound_devices(), 1);
  cr_assert_eq(ofInfo, -1);
  cr_assert_eq(ofIdInfo, 2);

  i2c_unregister_device(client);

  // Matched by the compatible string only
  client = newClient("other", 0x12, "vendor,chip");
  cr_assert_not(IS_ERR(client));

  cr_assert_eq(emu_bound_devices(), 1);
  cr_assert_eq(ofInfo, 1);
  cr_assert_eq(ofIdInfo, -1);

  i2c_unregister_device(client);
}
