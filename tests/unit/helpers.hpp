/* Helpers for unit tests.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstring>

#include <devbind/host/bindings.h>
#include <devbind/kernel/error.hpp>

// Run f and return the errno of a raised kernel::Error, or 0.
template <typename F> int catchErrno(F &&f) {
  try {
    f();
  } catch (const devbind::kernel::Error &e) {
    return e.getErrno();
  }

  return 0;
}

inline struct i2c_client *newClient(const char *type, unsigned short addr,
                                    const char *compatible = nullptr,
                                    unsigned short flags = 0) {
  struct i2c_board_info info = {};

  strncpy(info.type, type, sizeof(info.type) - 1);
  info.addr = addr;
  info.flags = flags;
  info.of_compatible = compatible;

  return i2c_new_client_device(nullptr, &info);
}
