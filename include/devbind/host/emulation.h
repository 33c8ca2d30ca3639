/* Control interface of the emulated host kernel.
 *
 * These entry points have no counterpart in a real kernel. They configure the
 * emulation and make failure paths reachable.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Let the next call of the host entry point named `function` fail with `error`
//
// @param function Name of the entry point, e.g. "i2c_register_driver"
// @param error Negative errno returned by the failing call
// @retval 0 Success.
// @retval -EINVAL Unknown entry point or non-negative error.
int emu_inject_fault(const char *function, int error);

// Drop all pending faults.
void emu_clear_faults(void);

// Replace the list of firmware search directories.
//
// @param paths Colon separated list of directories.
int emu_firmware_set_search_path(const char *paths);

// Add a blob to the built-in firmware store used as fallback loader.
int emu_firmware_add_builtin(const char *name, const uint8_t *data, size_t size);

// Number of firmware blobs handed out and not yet released.
size_t emu_firmware_outstanding(void);

// Number of devices which are currently bound to a driver.
size_t emu_bound_devices(void);

// Number of devices waiting for a deferred probe.
size_t emu_deferred_devices(void);

#ifdef __cplusplus
} // extern "C"
#endif
