/* Unit tests for firmware loading.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <criterion/criterion.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <unistd.h>

#include <devbind/host/emulation.h>
#include <devbind/kernel/firmware.hpp>
#include <devbind/kernel/platform.hpp>

#include "helpers.hpp"

using namespace devbind::kernel;

static struct platform_device *pdev;

static void init_device() {
  // Keep the lookup away from the firmware of the build host
  emu_firmware_set_search_path("/nonexistent");

  pdev = platform_device_register_simple("fw-user", PLATFORM_DEVID_NONE,
                                         nullptr);
}

static void fini_device() { platform_device_unregister(pdev); }

// cppcheck-suppress unknownMacro
TestSuite(firmware, .description = "Firmware loading", .init = init_device,
          .fini = fini_device);

static const uint8_t blob[] = {0xde, 0xad, 0xbe, 0xef, 0x01};

Test(firmware, missing) {
  platform::Device dev(pdev);

  int err = catchErrno([&dev] { Firmware::request("missing.bin", dev); });

  cr_assert_eq(err, ENOENT);
  cr_assert_eq(emu_firmware_outstanding(), 0);

  err = catchErrno([&dev] { Firmware::requestNowarn("missing.bin", dev); });

  cr_assert_eq(err, ENOENT);
  cr_assert_eq(emu_firmware_outstanding(), 0);
}

Test(firmware, empty_name) {
  platform::Device dev(pdev);

  int err = catchErrno([&dev] { Firmware::request("", dev); });

  cr_assert_eq(err, EINVAL);
}

Test(firmware, builtin) {
  platform::Device dev(pdev);

  cr_assert_eq(emu_firmware_add_builtin("blob.bin", blob, sizeof(blob)), 0);

  {
    auto fw = Firmware::request("blob.bin", dev);

    cr_assert_eq(fw->size(), sizeof(blob));
    cr_assert_eq(fw->data().size(), sizeof(blob));
    cr_assert_arr_eq(fw->data().data(), blob, sizeof(blob));
    cr_assert_eq(emu_firmware_outstanding(), 1);

    auto fw2 = Firmware::requestNowarn("blob.bin", dev);
    cr_assert_eq(emu_firmware_outstanding(), 2);
  }

  cr_assert_eq(emu_firmware_outstanding(), 0);
}

Test(firmware, direct_without_fallback) {
  platform::Device dev(pdev);

  cr_assert_eq(emu_firmware_add_builtin("blob.bin", blob, sizeof(blob)), 0);

  int err = catchErrno([&dev] { Firmware::requestDirect("blob.bin", dev); });

  cr_assert_eq(err, ENOENT);
  cr_assert_eq(emu_firmware_outstanding(), 0);
}

Test(firmware, search_path) {
  platform::Device dev(pdev);

  char dir[] = "/tmp/devbind-fw-XXXXXX";
  cr_assert_not_null(mkdtemp(dir));

  auto path = std::string(dir) + "/file.bin";

  {
    std::ofstream f(path, std::ios::binary);
    f.write(reinterpret_cast<const char *>(blob), sizeof(blob));
  }

  auto paths = std::string("/nonexistent:") + dir;
  cr_assert_eq(emu_firmware_set_search_path(paths.c_str()), 0);

  {
    auto fw = Firmware::requestDirect("file.bin", dev);

    cr_assert_eq(fw->size(), sizeof(blob));
    cr_assert_eq(fw->data()[0], 0xde);
    cr_assert_eq(fw->data()[4], 0x01);
  }

  cr_assert_eq(emu_firmware_outstanding(), 0);

  unlink(path.c_str());
  rmdir(dir);
}

Test(firmware, request_fault) {
  platform::Device dev(pdev);

  cr_assert_eq(emu_firmware_add_builtin("blob.bin", blob, sizeof(blob)), 0);

  emu_inject_fault("request_firmware", -ENOMEM);

  int err = catchErrno([&dev] { Firmware::request("blob.bin", dev); });

  cr_assert_eq(err, ENOMEM);
  cr_assert_eq(emu_firmware_outstanding(), 0);
}
