/* Software real time clock on an I2C bus.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdint>
#include <utility>

#include <devbind/drivers/softrtc.hpp>
#include <devbind/kernel/error.hpp>
#include <devbind/kernel/firmware.hpp>
#include <devbind/kernel/module.hpp>

using namespace devbind;
using namespace devbind::drivers;
using namespace devbind::kernel;

time_t Clock::now() const {
  std::lock_guard<std::mutex> guard(mutex);

  return time(nullptr) + offset;
}

void Clock::set(time_t t) {
  std::lock_guard<std::mutex> guard(mutex);

  offset = t - time(nullptr);
}

time_t Clock::getOffset() const {
  std::lock_guard<std::mutex> guard(mutex);

  return offset;
}

void Clock::setOffset(time_t off) {
  std::lock_guard<std::mutex> guard(mutex);

  offset = off;
}

void ClockOps::readTime(const std::shared_ptr<Clock> &clock,
                        rtc::RtcTime &tm) {
  tm.fromTime64(clock->now());
}

void ClockOps::setTime(const std::shared_ptr<Clock> &clock,
                       const rtc::RtcTime &tm) {
  clock->set(tm.toTime64());
}

time_t drivers::parseCalibration(const ByteView &data) {
  if (data.size() < 4)
    throw Error(EINVAL, "Calibration data too short: {} bytes", data.size());

  uint32_t raw = uint32_t(data[0]) | uint32_t(data[1]) << 8 |
                 uint32_t(data[2]) << 16 | uint32_t(data[3]) << 24;

  return static_cast<int32_t>(raw);
}

SoftRtc::SoftRtc(const device::RawDevice &dev, std::shared_ptr<Clock> clk)
    : clock(std::move(clk)), logger(Log::get("driver:softrtc")) {
  registration.registerRtc(dev, clock);
}

void SoftRtc::deviceRemove() {
  logger->debug("Clock stopped at offset {}s", clock->getOffset());
}

const driver::IdArray<of::DeviceId, SoftRtcDriver::IdInfo, 2>
    SoftRtcDriver::ofIdTable = {{
        {"devbind,softrtc"},
        {"devbind,softrtc-cal", Model{"softrtc-cal.bin"}},
    }};

const driver::IdArray<i2c::DeviceId, SoftRtcDriver::DeviceIdInfo, 2>
    SoftRtcDriver::idTable = {{
        {"softrtc"},
        {"softrtc-cal", Model{"softrtc-cal.bin"}},
    }};

SoftRtcDriver::Data SoftRtcDriver::probe(i2c::Client &client,
                                         const IdInfo *info,
                                         const DeviceIdInfo *idInfo) {
  auto logger = Log::get("driver:softrtc");

  const Model *model = info ? info : idInfo;

  auto clock = std::make_shared<Clock>();

  if (model && model->calibration) {
    try {
      auto fw = Firmware::requestNowarn(model->calibration, client);

      clock->setOffset(parseCalibration(fw->data()));
    } catch (const Error &e) {
      if (e.getErrno() != ENOENT)
        throw;

      logger->info("{}: No calibration found, starting uncalibrated",
                   client.name());
    }
  }

  auto softRtc = std::make_unique<SoftRtc>(client, clock);

  logger->info("{}: Probed at 0x{:02x} as {}", client.name(), client.addr(),
               dev_name(&softRtc->getRegistration().raw()->dev));

  return softRtc;
}

void SoftRtcDriver::remove(Data &data) {
  Log::get("driver:softrtc")
      ->info("Removing clock with offset {}s", data->getClock()->getOffset());
}

static char n[] = "softrtc";
static char d[] = "Software real time clock on an I2C bus";
static ModulePlugin<driver::Module<i2c::DriverAdapter<SoftRtcDriver>>, n, d>
    p;
