/* Real time clock class devices.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <devbind/kernel/rtc.hpp>

using namespace devbind::kernel::rtc;

time_t RtcTime::toTime64() const {
  struct tm t = {};

  t.tm_sec = tm->tm_sec;
  t.tm_min = tm->tm_min;
  t.tm_hour = tm->tm_hour;
  t.tm_mday = tm->tm_mday;
  t.tm_mon = tm->tm_mon;
  t.tm_year = tm->tm_year;

  return timegm(&t);
}

void RtcTime::fromTime64(time_t secs) {
  struct tm t;

  if (!gmtime_r(&secs, &t))
    throw Error(EOVERFLOW, "Time {} can not be represented", secs);

  tm->tm_sec = t.tm_sec;
  tm->tm_min = t.tm_min;
  tm->tm_hour = t.tm_hour;
  tm->tm_mday = t.tm_mday;
  tm->tm_mon = t.tm_mon;
  tm->tm_year = t.tm_year;
  tm->tm_wday = t.tm_wday;
  tm->tm_yday = t.tm_yday;
  tm->tm_isdst = 0;
}
