/* Emulated RTC class.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <climits>
#include <cstring>
#include <list>
#include <mutex>
#include <new>
#include <set>

#include "core.hpp"

using namespace devbind;

namespace {

std::mutex rtcLock;
std::list<struct rtc_device *> rtcs;
std::set<int> ids;

int allocId() {
  std::lock_guard<std::mutex> guard(rtcLock);

  int id = 0;
  while (ids.count(id))
    id++;

  ids.insert(id);

  return id;
}

void rtcDeviceRelease(struct device *dev) {
  auto *rtc = container_of(dev, struct rtc_device, dev);

  {
    std::lock_guard<std::mutex> guard(rtcLock);

    ids.erase(rtc->id);
  }

  delete rtc;
}

void devmRtcRelease(void *data) {
  put_device(&static_cast<struct rtc_device *>(data)->dev);
}

void devmRtcUnregister(void *data) {
  rtc_device_unregister(static_cast<struct rtc_device *>(data));
}

bool isLeapYear(int year) {
  return (!(year % 4) && (year % 100)) || !(year % 400);
}

int monthDays(int month, int year) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

  return days[month] + (isLeapYear(year) && month == 1);
}

bool isValidTime(const struct rtc_time *tm) {
  if (tm->tm_year < 70 || tm->tm_year > (INT_MAX - 1900) || tm->tm_mon < 0 ||
      tm->tm_mon >= 12 || tm->tm_mday < 1 ||
      tm->tm_mday > monthDays(tm->tm_mon, tm->tm_year + 1900) ||
      tm->tm_hour < 0 || tm->tm_hour >= 24 || tm->tm_min < 0 ||
      tm->tm_min >= 60 || tm->tm_sec < 0 || tm->tm_sec >= 60)
    return false;

  return true;
}

struct rtc_device *allocate(struct device *parent) {
  if (!parent)
    return static_cast<struct rtc_device *>(ERR_PTR(-EINVAL));

  int ret = host::consumeFault("devm_rtc_allocate_device");
  if (ret)
    return static_cast<struct rtc_device *>(ERR_PTR(ret));

  auto *rtc = new (std::nothrow) rtc_device{};
  if (!rtc)
    return static_cast<struct rtc_device *>(ERR_PTR(-ENOMEM));

  device_initialize(&rtc->dev);
  if (!rtc->dev.p) {
    delete rtc;
    return static_cast<struct rtc_device *>(ERR_PTR(-ENOMEM));
  }

  rtc->id = allocId();
  rtc->dev.parent = parent;
  rtc->dev.release = rtcDeviceRelease;

  ret = dev_set_name(&rtc->dev, fmt::format("rtc{}", rtc->id).c_str());
  if (!ret)
    ret = host::addDevres(parent, devmRtcRelease, rtc);

  if (ret) {
    put_device(&rtc->dev);
    return static_cast<struct rtc_device *>(ERR_PTR(ret));
  }

  return rtc;
}

} // namespace

struct rtc_device *devm_rtc_allocate_device(struct device *parent) {
  try {
    return allocate(parent);
  } catch (const std::bad_alloc &) {
    return static_cast<struct rtc_device *>(ERR_PTR(-ENOMEM));
  }
}

int devm_rtc_register_device(struct rtc_device *rtc) {
  auto logger = Log::get("host:rtc");

  if (IS_ERR_OR_NULL(rtc))
    return -EINVAL;

  int ret = host::consumeFault("devm_rtc_register_device");
  if (ret)
    return ret;

  if (!rtc->ops) {
    logger->error("{}: no ops set", dev_name(&rtc->dev));
    return -EINVAL;
  }

  ret = device_add(&rtc->dev);
  if (ret)
    return ret;

  {
    std::lock_guard<std::mutex> guard(rtc->dev.p->lock);

    rtc->registered = 1;
  }

  try {
    std::lock_guard<std::mutex> guard(rtcLock);

    rtcs.push_back(rtc);
  } catch (const std::bad_alloc &) {
    rtc_device_unregister(rtc);
    return -ENOMEM;
  }

  ret = host::addDevres(rtc->dev.parent, devmRtcUnregister, rtc);
  if (ret) {
    rtc_device_unregister(rtc);
    return ret;
  }

  logger->info("{}: registered as {}", dev_name(rtc->dev.parent),
               dev_name(&rtc->dev));

  return 0;
}

void rtc_device_unregister(struct rtc_device *rtc) {
  if (IS_ERR_OR_NULL(rtc) || !rtc->dev.p)
    return;

  {
    std::lock_guard<std::mutex> guard(rtc->dev.p->lock);

    if (!rtc->registered)
      return;

    rtc->registered = 0;
    rtc->ops = nullptr;
  }

  {
    std::lock_guard<std::mutex> guard(rtcLock);

    rtcs.remove(rtc);
  }

  device_del(&rtc->dev);

  Log::get("host:rtc")->info("Unregistered {}", dev_name(&rtc->dev));
}

int rtc_read_time(struct rtc_device *rtc, struct rtc_time *tm) {
  if (!rtc || !tm || !rtc->dev.p)
    return -EINVAL;

  std::lock_guard<std::mutex> guard(rtc->dev.p->lock);

  if (!rtc->registered || !rtc->ops)
    return -ENODEV;

  if (!rtc->ops->read_time)
    return -EINVAL;

  memset(tm, 0, sizeof(*tm));

  int ret = rtc->ops->read_time(&rtc->dev, tm);
  if (ret)
    return ret;

  return isValidTime(tm) ? 0 : -EINVAL;
}

int rtc_set_time(struct rtc_device *rtc, struct rtc_time *tm) {
  if (!rtc || !tm || !rtc->dev.p)
    return -EINVAL;

  if (!isValidTime(tm))
    return -EINVAL;

  std::lock_guard<std::mutex> guard(rtc->dev.p->lock);

  if (!rtc->registered || !rtc->ops)
    return -ENODEV;

  if (!rtc->ops->set_time)
    return -EINVAL;

  return rtc->ops->set_time(&rtc->dev, tm);
}

struct rtc_device *rtc_class_open(const char *name) {
  if (!name)
    return nullptr;

  std::lock_guard<std::mutex> guard(rtcLock);

  for (auto *rtc : rtcs) {
    if (!strcmp(dev_name(&rtc->dev), name)) {
      get_device(&rtc->dev);
      return rtc;
    }
  }

  return nullptr;
}

void rtc_class_close(struct rtc_device *rtc) {
  if (rtc)
    put_device(&rtc->dev);
}
