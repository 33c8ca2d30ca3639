/* Unit tests for RTC class devices.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <criterion/criterion.h>

#include <memory>

#include <devbind/host/emulation.h>
#include <devbind/kernel/platform.hpp>
#include <devbind/kernel/rtc.hpp>

#include "helpers.hpp"

using namespace devbind::kernel;

// cppcheck-suppress unknownMacro
TestSuite(rtc, .description = "RTC class device registration");

static int clockDrops;

struct TestClock {
  time_t secs;

  explicit TestClock(time_t s) : secs(s) {}

  ~TestClock() { clockDrops++; }
};

struct FullOps {
  using Data = std::shared_ptr<TestClock>;

  static void readTime(const Data &clock, rtc::RtcTime &tm) {
    tm.fromTime64(clock->secs);
  }

  static void setTime(const Data &clock, const rtc::RtcTime &tm) {
    clock->secs = tm.toTime64();
  }
};

struct ReadOnlyOps {
  using Data = std::shared_ptr<TestClock>;

  static void readTime(const Data &clock, rtc::RtcTime &tm) {
    tm.fromTime64(clock->secs);
  }
};

static struct platform_device *newParent() {
  // Not bound to any driver
  auto *pdev =
      platform_device_register_simple("rtc-parent", PLATFORM_DEVID_NONE, nullptr);
  cr_assert_not(IS_ERR(pdev));

  return pdev;
}

// 2023-11-14 22:13:20 UTC
static const time_t someTime = 1700000000;

Test(rtc, read_set) {
  auto *pdev = newParent();
  platform::Device parent(pdev);

  rtc::Registration<FullOps> reg;
  reg.registerRtc(parent, std::make_shared<TestClock>(someTime));

  cr_assert(reg.isRegistered());
  cr_assert_str_eq(dev_name(&reg.raw()->dev), "rtc0");
  cr_assert_eq(reg.raw()->dev.parent, &pdev->dev);

  auto *handle = rtc_class_open("rtc0");
  cr_assert_eq(handle, reg.raw());

  struct rtc_time tm = {};
  cr_assert_eq(rtc_read_time(handle, &tm), 0);

  rtc::RtcTime t(&tm);
  cr_assert_eq(t.toTime64(), someTime);
  cr_assert_eq(t.getYear(), 123);
  cr_assert_eq(t.getMon(), 10);
  cr_assert_eq(t.getMday(), 14);
  cr_assert_eq(t.getHour(), 22);

  t.fromTime64(someTime + 3600);
  cr_assert_eq(rtc_set_time(handle, &tm), 0);

  struct rtc_time tm2 = {};
  cr_assert_eq(rtc_read_time(handle, &tm2), 0);
  cr_assert_eq(rtc::RtcTime(&tm2).toTime64(), someTime + 3600);

  // Invalid times are rejected before reaching the operations
  tm.tm_mon = 12;
  cr_assert_eq(rtc_set_time(handle, &tm), -EINVAL);

  rtc_class_close(handle);
  platform_device_unregister(pdev);
}

Test(rtc, register_twice) {
  auto *pdev = newParent();
  platform::Device parent(pdev);

  rtc::Registration<FullOps> reg;
  reg.registerRtc(parent, std::make_shared<TestClock>(someTime));

  auto *raw = reg.raw();

  int err = catchErrno([&] {
    reg.registerRtc(parent, std::make_shared<TestClock>(0));
  });

  cr_assert_eq(err, EINVAL);
  cr_assert(reg.isRegistered());
  cr_assert_eq(reg.raw(), raw);

  // Only the rejected data has been dropped
  cr_assert_eq(clockDrops, 1);
  cr_assert_null(rtc_class_open("rtc1"));

  platform_device_unregister(pdev);
}

Test(rtc, missing_operation) {
  auto *pdev = newParent();
  platform::Device parent(pdev);

  rtc::Registration<ReadOnlyOps> reg;
  reg.registerRtc(parent, std::make_shared<TestClock>(someTime));

  cr_assert_not_null(reg.raw()->ops->read_time);
  cr_assert_null(reg.raw()->ops->set_time);

  struct rtc_time tm = {};
  cr_assert_eq(rtc_read_time(reg.raw(), &tm), 0);
  cr_assert_eq(rtc_set_time(reg.raw(), &tm), -EINVAL);

  platform_device_unregister(pdev);
}

Test(rtc, register_fault) {
  auto *pdev = newParent();
  platform::Device parent(pdev);

  emu_inject_fault("devm_rtc_register_device", -EIO);

  rtc::Registration<FullOps> reg;

  int err = catchErrno([&] {
    reg.registerRtc(parent, std::make_shared<TestClock>(someTime));
  });

  // The data is dropped immediately
  cr_assert_eq(err, EIO);
  cr_assert_eq(clockDrops, 1);
  cr_assert_not(reg.isRegistered());
  cr_assert_null(rtc_class_open("rtc0"));

  platform_device_unregister(pdev);

  cr_assert_eq(clockDrops, 1);
}

Test(rtc, allocate_fault) {
  auto *pdev = newParent();
  platform::Device parent(pdev);

  emu_inject_fault("devm_rtc_allocate_device", -ENOMEM);

  rtc::Registration<FullOps> reg;

  int err = catchErrno([&] {
    reg.registerRtc(parent, std::make_shared<TestClock>(someTime));
  });

  cr_assert_eq(err, ENOMEM);
  cr_assert_eq(clockDrops, 1);
  cr_assert_not(reg.isRegistered());

  platform_device_unregister(pdev);
}

Test(rtc, destroy_registration) {
  auto *pdev = newParent();
  platform::Device parent(pdev);

  auto reg = std::make_unique<rtc::Registration<FullOps>>();
  reg->registerRtc(parent, std::make_shared<TestClock>(someTime));

  auto *handle = rtc_class_open("rtc0");
  cr_assert_not_null(handle);

  reg.reset();

  cr_assert_eq(clockDrops, 1);
  cr_assert_null(rtc_class_open("rtc0"));

  // Handles opened before report the device as gone
  struct rtc_time tm = {};
  cr_assert_eq(rtc_read_time(handle, &tm), -ENODEV);

  rtc_class_close(handle);
  platform_device_unregister(pdev);

  cr_assert_eq(clockDrops, 1);
}

Test(rtc, parent_gone_first) {
  auto *pdev = newParent();

  auto reg = std::make_unique<rtc::Registration<FullOps>>();

  {
    platform::Device parent(pdev);
    reg->registerRtc(parent, std::make_shared<TestClock>(someTime));
  }

  auto *handle = rtc_class_open("rtc0");
  cr_assert_not_null(handle);

  platform_device_unregister(pdev);

  cr_assert_eq(clockDrops, 1);

  struct rtc_time tm = {};
  cr_assert_eq(rtc_read_time(handle, &tm), -ENODEV);

  rtc_class_close(handle);

  reg.reset();

  cr_assert_eq(clockDrops, 1);
}
