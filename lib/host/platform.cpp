/* Emulated platform bus.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>
#include <new>
#include <string>

#include <devbind/utils.hpp>

#include "core.hpp"

using namespace devbind;

namespace {

struct PlatformInstance {
  struct platform_device pdev;
  struct device_node node;
};

struct platform_device *toPlatformDevice(struct device *dev) {
  return container_of(dev, struct platform_device, dev);
}

struct platform_driver *toPlatformDriver(struct device_driver *drv) {
  return container_of(drv, struct platform_driver, driver);
}

int platformMatch(struct device *dev, struct device_driver *drv) {
  // Attempt an OF style match first
  if (of_match_device(drv->of_match_table, dev))
    return 1;

  // Then try to match against the driver name
  return !strcmp(toPlatformDevice(dev)->name, drv->name);
}

int platformProbe(struct device *dev) {
  auto *drv = toPlatformDriver(dev->driver);
  if (!drv->probe)
    return -ENODEV;

  return drv->probe(toPlatformDevice(dev));
}

int platformRemove(struct device *dev) {
  auto *drv = toPlatformDriver(dev->driver);
  if (!drv->remove)
    return 0;

  return drv->remove(toPlatformDevice(dev));
}

void platformDeviceRelease(struct device *dev) {
  auto *pdev = toPlatformDevice(dev);

  delete container_of(pdev, PlatformInstance, pdev);
}

struct platform_device *registerSimple(const char *name, int id,
                                       const char *of_compatible) {
  auto logger = Log::get("host:platform");

  if (!name)
    return static_cast<struct platform_device *>(ERR_PTR(-EINVAL));

  int ret = host::consumeFault("platform_device_register_simple");
  if (ret)
    return static_cast<struct platform_device *>(ERR_PTR(ret));

  auto *inst = new (std::nothrow) PlatformInstance{};
  if (!inst)
    return static_cast<struct platform_device *>(ERR_PTR(-ENOMEM));

  auto *pdev = &inst->pdev;

  if (!utils::copyName(pdev->name, sizeof(pdev->name), name) ||
      (of_compatible &&
       !utils::copyName(inst->node.compatible, sizeof(inst->node.compatible),
                        of_compatible))) {
    logger->error("Name of platform device {} is too long", name);
    delete inst;
    return static_cast<struct platform_device *>(ERR_PTR(-EINVAL));
  }

  if (of_compatible) {
    memcpy(inst->node.full_name, pdev->name, sizeof(pdev->name));
    pdev->dev.of_node = &inst->node;
  }

  pdev->id = id;

  device_initialize(&pdev->dev);
  if (!pdev->dev.p) {
    delete inst;
    return static_cast<struct platform_device *>(ERR_PTR(-ENOMEM));
  }

  pdev->dev.bus = &platform_bus_type;
  pdev->dev.release = platformDeviceRelease;

  std::string devName = id == PLATFORM_DEVID_NONE
                            ? std::string(pdev->name)
                            : fmt::format("{}.{}", pdev->name, id);

  ret = dev_set_name(&pdev->dev, devName.c_str());
  if (!ret)
    ret = device_add(&pdev->dev);

  if (ret) {
    logger->error("Failed to register platform device {}: {}", devName, ret);
    put_device(&pdev->dev);
    return static_cast<struct platform_device *>(ERR_PTR(ret));
  }

  logger->info("Registered platform device {}", devName);

  return pdev;
}

} // namespace

struct bus_type platform_bus_type = {
    "platform",
    platformMatch,
    platformProbe,
    platformRemove,
};

int __platform_driver_register(struct platform_driver *drv,
                               struct module *owner) {
  int ret = host::consumeFault("__platform_driver_register");
  if (ret)
    return ret;

  drv->driver.owner = owner;
  drv->driver.bus = &platform_bus_type;

  return driver_register(&drv->driver);
}

void platform_driver_unregister(struct platform_driver *drv) {
  driver_unregister(&drv->driver);
}

struct platform_device *platform_device_register_simple(const char *name,
                                                        int id,
                                                        const char *of_compatible) {
  try {
    return registerSimple(name, id, of_compatible);
  } catch (const std::bad_alloc &) {
    return static_cast<struct platform_device *>(ERR_PTR(-ENOMEM));
  }
}

void platform_device_unregister(struct platform_device *pdev) {
  if (IS_ERR_OR_NULL(pdev))
    return;

  device_unregister(&pdev->dev);
}
