/* Kernel error codes.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <devbind/kernel/error.hpp>
#include <devbind/log.hpp>

void devbind::kernel::logUnexpectedException(const std::exception &e) {
  Log::get("kernel")->error("Unexpected exception in driver callback: {}",
                            e.what());
}
