/* Platform device drivers.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <utility>
#include <variant>

#include <devbind/host/bindings.h>
#include <devbind/kernel/device.hpp>
#include <devbind/kernel/driver.hpp>
#include <devbind/kernel/error.hpp>
#include <devbind/kernel/of.hpp>
#include <devbind/kernel/types.hpp>
#include <devbind/log.hpp>

namespace devbind {
namespace kernel {
namespace platform {

// A platform device as passed to the callbacks of a driver.
//
// Only valid for the duration of the callback.
class Device : public device::RawDevice {

protected:
  struct platform_device *pdev;

public:
  explicit Device(struct platform_device *p) : pdev(p) {}

  Device(const Device &) = delete;
  Device(Device &&) = delete;
  Device &operator=(const Device &) = delete;
  Device &operator=(Device &&) = delete;

  struct ::device *rawDevice() const override { return &pdev->dev; }

  struct platform_device *raw() const { return pdev; }

  int id() const { return pdev->id; }
};

// Defaults for platform drivers.
//
//   using Data = ...;
//   using IdInfo = ...;
//   static const driver::IdArray<of::DeviceId, IdInfo, N> ofIdTable;
//   static Data probe(platform::Device &, const IdInfo *);
//   static void remove(Data &);
class Driver {

public:
  using Data = std::monostate;
  using IdInfo = std::monostate;
};

// Registers a driver T with the platform bus.
template <typename T> class DriverAdapter {

public:
  using RegType = struct platform_driver;
  using Data = typename T::Data;
  using Wrapper = PointerWrapper<Data>;

  static void registerDriver(RegType &reg, const char *name,
                             struct module *module) {
    reg.driver.name = name;
    reg.probe = probeCallback;
    reg.remove = removeCallback;

    if constexpr (driver::HasOfIdTable<T>::value)
      reg.driver.of_match_table = T::ofIdTable.table().asRaw();

    toResult(__platform_driver_register(&reg, module));

    Log::get("kernel:platform")->debug("Registered driver: {}", name);
  }

  static void unregisterDriver(RegType &reg) {
    platform_driver_unregister(&reg);

    Log::get("kernel:platform")
        ->debug("Unregistered driver: {}", reg.driver.name);
  }

protected:
  static int probeCallback(struct platform_device *p) {
    return fromKernelResult([p] {
      Device pdev(p);

      const typename T::IdInfo *info = nullptr;

      if constexpr (driver::HasOfIdTable<T>::value) {
        auto table = T::ofIdTable.table();
        info = table.info(of_match_device(table.asRaw(), &p->dev));
      }

      Data data = T::probe(pdev, info);

      platform_set_drvdata(p, Wrapper::intoPointer(std::move(data)));
    });
  }

  static int removeCallback(struct platform_device *p) {
    void *ptr = platform_get_drvdata(p);
    platform_set_drvdata(p, nullptr);

    Data data = Wrapper::fromPointer(ptr);

    int ret = fromKernelResult([&data] {
      if constexpr (driver::HasRemove<T>::value)
        T::remove(data);
    });

    int hookRet = fromKernelResult([&data] { driver::deviceRemove(data); });
    if (hookRet)
      Log::get("kernel:platform")
          ->warn("Device removal hook of {} failed: {}", dev_name(&p->dev),
                 hookRet);

    return ret;
  }
};

} // namespace platform
} // namespace kernel
} // namespace devbind
