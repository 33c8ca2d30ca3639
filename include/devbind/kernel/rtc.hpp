/* Real time clock class devices.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ctime>
#include <optional>
#include <type_traits>
#include <utility>

#include <devbind/host/bindings.h>
#include <devbind/kernel/device.hpp>
#include <devbind/kernel/error.hpp>
#include <devbind/kernel/types.hpp>
#include <devbind/log.hpp>

namespace devbind {
namespace kernel {
namespace rtc {

// Accessor for a broken down time as exchanged with the RTC class.
class RtcTime {

protected:
  struct rtc_time *tm;

public:
  explicit RtcTime(struct rtc_time *t) : tm(t) {}

  int getSec() const { return tm->tm_sec; }
  int getMin() const { return tm->tm_min; }
  int getHour() const { return tm->tm_hour; }
  int getMday() const { return tm->tm_mday; }
  int getMon() const { return tm->tm_mon; }
  int getYear() const { return tm->tm_year; }
  int getWday() const { return tm->tm_wday; }
  int getYday() const { return tm->tm_yday; }
  int getIsdst() const { return tm->tm_isdst; }

  void setSec(int v) { tm->tm_sec = v; }
  void setMin(int v) { tm->tm_min = v; }
  void setHour(int v) { tm->tm_hour = v; }
  void setMday(int v) { tm->tm_mday = v; }
  void setMon(int v) { tm->tm_mon = v; }
  void setYear(int v) { tm->tm_year = v; }
  void setWday(int v) { tm->tm_wday = v; }
  void setYday(int v) { tm->tm_yday = v; }
  void setIsdst(int v) { tm->tm_isdst = v; }

  // Seconds since the epoch (UTC)
  time_t toTime64() const;

  void fromTime64(time_t secs);

  struct rtc_time *raw() const { return tm; }
};

template <typename T, typename = void> struct HasReadTime : std::false_type {};

template <typename T>
struct HasReadTime<T, std::void_t<decltype(T::readTime(
                          std::declval<typename PointerWrapper<
                              typename T::Data>::Borrowed>(),
                          std::declval<RtcTime &>()))>> : std::true_type {};

template <typename T, typename = void> struct HasSetTime : std::false_type {};

template <typename T>
struct HasSetTime<T, std::void_t<decltype(T::setTime(
                         std::declval<typename PointerWrapper<
                             typename T::Data>::Borrowed>(),
                         std::declval<const RtcTime &>()))>>
    : std::true_type {};

// Registration of an RTC class device with operations T.
//
// T provides `using Data = ...` and optionally
//
//   static void readTime(Borrowed data, RtcTime &tm);
//   static void setTime(Borrowed data, const RtcTime &tm);
//
// where Borrowed is PointerWrapper<Data>::Borrowed. Only the provided
// operations are installed.
//
// The host keeps the address of the embedded operations table, so
// registrations can neither be copied nor moved. The data is dropped exactly
// once: either when this object is destroyed or when the parent device is
// unbound, whichever comes first.
template <typename T> class Registration {

public:
  using Data = typename T::Data;
  using Wrapper = PointerWrapper<Data>;

protected:
  struct rtc_device *rtc;
  struct rtc_class_ops ops;
  std::optional<device::Device> parent;

  Logger logger;

  static void releaseData(void *ptr) {
    auto *r = static_cast<struct rtc_device *>(ptr);

    void *data = dev_get_drvdata(&r->dev);
    dev_set_drvdata(&r->dev, nullptr);

    // Dropped at the end of scope
    Wrapper::fromPointer(data);
  }

  static int readTimeCallback(struct ::device *dev, struct rtc_time *tm) {
    return fromKernelResult([dev, tm] {
      RtcTime t(tm);
      T::readTime(Wrapper::borrow(dev_get_drvdata(dev)), t);
    });
  }

  static int setTimeCallback(struct ::device *dev, struct rtc_time *tm) {
    return fromKernelResult([dev, tm] {
      const RtcTime t(tm);
      T::setTime(Wrapper::borrow(dev_get_drvdata(dev)), t);
    });
  }

public:
  Registration() : rtc(nullptr), ops{}, logger(Log::get("kernel:rtc")) {}

  Registration(const Registration &) = delete;
  Registration &operator=(const Registration &) = delete;

  ~Registration() {
    if (!parent)
      return;

    rtc_device_unregister(rtc);

    // The action is gone if the parent has been unbound before
    int ret = devm_release_action(parent->rawDevice(), releaseData, rtc);
    if (ret && ret != -ENOENT)
      logger->warn("Failed to release data of {}: {}", dev_name(&rtc->dev),
                   ret);

    put_device(&rtc->dev);
  }

  // Register a new RTC class device below parent.
  void registerRtc(const device::RawDevice &p, Data data) {
    if (parent)
      throw Error(EINVAL, "RTC {} is already registered", dev_name(&rtc->dev));

    ops = {};

    if constexpr (HasReadTime<T>::value)
      ops.read_time = readTimeCallback;

    if constexpr (HasSetTime<T>::value)
      ops.set_time = setTimeCallback;

    auto *r = fromErrPtr(devm_rtc_allocate_device(p.rawDevice()));

    r->ops = &ops;
    dev_set_drvdata(&r->dev, Wrapper::intoPointer(std::move(data)));

    int ret = devm_add_action(p.rawDevice(), releaseData, r);
    if (ret) {
      releaseData(r);
      throw Error(ret, "Failed to add release action of {}", dev_name(&r->dev));
    }

    ret = devm_rtc_register_device(r);
    if (ret) {
      // Runs releaseData() immediately
      int rret = devm_release_action(p.rawDevice(), releaseData, r);
      if (rret)
        logger->warn("Failed to release data of {}: {}", dev_name(&r->dev),
                     rret);

      throw Error(ret, "Failed to register {}", dev_name(&r->dev));
    }

    rtc = r;
    get_device(&rtc->dev);
    parent.emplace(p);

    logger->debug("Registered {} below {}", dev_name(&rtc->dev), p.name());
  }

  bool isRegistered() const { return parent.has_value(); }

  struct rtc_device *raw() const { return rtc; }
};

} // namespace rtc
} // namespace kernel
} // namespace devbind
