/* Software real time clock on an I2C bus.
 *
 * The clock keeps an offset to the system clock. Optionally the initial
 * offset is read from a calibration firmware blob whose first four bytes hold
 * a signed little-endian number of seconds.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ctime>
#include <memory>
#include <mutex>

#include <devbind/kernel/driver.hpp>
#include <devbind/kernel/i2c.hpp>
#include <devbind/kernel/of.hpp>
#include <devbind/kernel/rtc.hpp>
#include <devbind/kernel/types.hpp>
#include <devbind/log.hpp>

namespace devbind {
namespace drivers {

class Clock {

protected:
  mutable std::mutex mutex;

  // Seconds relative to the system clock
  time_t offset;

public:
  Clock(time_t off = 0) : offset(off) {}

  time_t now() const;

  void set(time_t t);

  time_t getOffset() const;

  void setOffset(time_t off);
};

// Operations of the RTC class device
class ClockOps {

public:
  using Data = std::shared_ptr<Clock>;

  static void readTime(const std::shared_ptr<Clock> &clock,
                       kernel::rtc::RtcTime &tm);

  static void setTime(const std::shared_ptr<Clock> &clock,
                      const kernel::rtc::RtcTime &tm);
};

// Extracts the clock offset from a calibration blob.
time_t parseCalibration(const kernel::ByteView &data);

// Per-device state of the driver
class SoftRtc {

protected:
  std::shared_ptr<Clock> clock;
  kernel::rtc::Registration<ClockOps> registration;

  Logger logger;

public:
  SoftRtc(const kernel::device::RawDevice &dev, std::shared_ptr<Clock> clk);

  const std::shared_ptr<Clock> &getClock() const { return clock; }

  const kernel::rtc::Registration<ClockOps> &getRegistration() const {
    return registration;
  }

  void deviceRemove();
};

class SoftRtcDriver : public kernel::i2c::Driver {

public:
  struct Model {
    // Name of the calibration firmware, if any
    const char *calibration;
  };

  using Data = std::unique_ptr<SoftRtc>;
  using IdInfo = Model;
  using DeviceIdInfo = Model;

  static const kernel::driver::IdArray<kernel::of::DeviceId, IdInfo, 2>
      ofIdTable;
  static const kernel::driver::IdArray<kernel::i2c::DeviceId, DeviceIdInfo, 2>
      idTable;

  static Data probe(kernel::i2c::Client &client, const IdInfo *info,
                    const DeviceIdInfo *idInfo);

  static void remove(Data &data);
};

} // namespace drivers
} // namespace devbind
