/* Emulated host driver core.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cstring>
#include <new>

#include <devbind/host/emulation.h>

#include "core.hpp"

using namespace devbind;
using namespace devbind::host;

Core::Core() : logger(Log::get("host:core")) {}

Core &Core::get() {
  // Devices may still be released during static destruction
  static auto *core = new Core();
  return *core;
}

int Core::addDevice(struct device *dev) {
  if (!dev || !dev->p)
    return -EINVAL;

  int ret = consumeFault("device_add");
  if (ret)
    return ret;

  if (dev->p->name.empty()) {
    if (!dev->init_name)
      return -EINVAL;

    dev->p->name = dev->init_name;
  }

  {
    std::lock_guard<std::mutex> guard(mutex);

    auto it = std::find_if(devices.begin(), devices.end(),
                           [dev](struct device *d) {
                             return d->p->name == dev->p->name;
                           });
    if (it != devices.end()) {
      logger->warn("Duplicate device name: {}", dev->p->name);
      return -EEXIST;
    }

    devices.push_back(dev);
    dev->p->added = true;
  }

  logger->debug("Added device {}", dev->p->name);

  if (attach(dev))
    triggerDeferred();

  return 0;
}

void Core::delDevice(struct device *dev) {
  if (!dev || !dev->p || !dev->p->added)
    return;

  release(dev);

  {
    std::lock_guard<std::mutex> guard(mutex);

    devices.remove(dev);
    deferred.remove(dev);
    dev->p->added = false;
  }

  releaseDevres(dev);

  logger->debug("Deleted device {}", dev->p->name);
}

int Core::addDriver(struct device_driver *drv) {
  if (!drv || !drv->name || !drv->bus)
    return -EINVAL;

  std::list<struct device *> candidates;

  {
    std::lock_guard<std::mutex> guard(mutex);

    for (auto *d : drivers) {
      if (d == drv || (d->bus == drv->bus && !strcmp(d->name, drv->name))) {
        logger->warn("Driver {} is already registered", drv->name);
        return -EBUSY;
      }
    }

    drivers.push_back(drv);

    for (auto *dev : devices) {
      if (dev->bus == drv->bus)
        candidates.push_back(dev);
    }
  }

  logger->debug("Registered driver {} on bus {}", drv->name, drv->bus->name);

  bool bound = false;
  for (auto *dev : candidates)
    bound |= attach(dev);

  if (bound)
    triggerDeferred();

  return 0;
}

void Core::delDriver(struct device_driver *drv) {
  if (!drv)
    return;

  std::list<struct device *> candidates;

  {
    std::lock_guard<std::mutex> guard(mutex);

    drivers.remove(drv);

    for (auto *dev : devices) {
      if (dev->driver == drv)
        candidates.push_back(dev);
    }
  }

  for (auto *dev : candidates)
    release(dev, drv);

  logger->debug("Unregistered driver {}", drv->name);
}

bool Core::attach(struct device *dev) {
  if (!dev->bus)
    return false;

  std::lock_guard<std::mutex> devGuard(dev->p->lock);

  if (dev->driver || !dev->p->added)
    return false;

  std::list<struct device_driver *> candidates;

  {
    std::lock_guard<std::mutex> guard(mutex);

    for (auto *drv : drivers) {
      if (drv->bus == dev->bus)
        candidates.push_back(drv);
    }
  }

  for (auto *drv : candidates) {
    if (!dev->bus->match || !dev->bus->match(dev, drv))
      continue;

    int ret = probe(dev, drv);
    if (ret == 0)
      return true;

    if (ret == -EPROBE_DEFER) {
      std::lock_guard<std::mutex> guard(mutex);

      if (std::find(deferred.begin(), deferred.end(), dev) == deferred.end())
        deferred.push_back(dev);

      return false;
    }
  }

  return false;
}

int Core::probe(struct device *dev, struct device_driver *drv) {
  dev->driver = drv;

  int ret = dev->bus->probe ? dev->bus->probe(dev) : 0;
  if (ret) {
    releaseDevres(dev);

    dev->driver = nullptr;
    dev->driver_data = nullptr;

    if (ret == -EPROBE_DEFER)
      logger->debug("Driver {} requests probe deferral of {}", drv->name,
                    dev->p->name);
    else
      logger->warn("{}: probe of {} failed with error {}", drv->name,
                   dev->p->name, ret);

    return ret;
  }

  {
    std::lock_guard<std::mutex> guard(mutex);

    deferred.remove(dev);
  }

  logger->info("Bound device {} to driver {}", dev->p->name, drv->name);

  return 0;
}

void Core::triggerDeferred() {
  for (;;) {
    std::list<struct device *> pending;

    {
      std::lock_guard<std::mutex> guard(mutex);

      pending.swap(deferred);
    }

    if (pending.empty())
      break;

    bool progress = false;
    for (auto *dev : pending)
      progress |= attach(dev);

    if (!progress)
      break;
  }
}

void Core::release(struct device *dev, struct device_driver *drv) {
  std::lock_guard<std::mutex> devGuard(dev->p->lock);

  auto *bound = dev->driver;
  if (!bound || (drv && bound != drv))
    return;

  if (dev->bus && dev->bus->remove) {
    int ret = dev->bus->remove(dev);
    if (ret)
      logger->warn("{}: remove of {} failed with error {}", bound->name,
                   dev->p->name, ret);
  }

  releaseDevres(dev);

  dev->driver = nullptr;
  dev->driver_data = nullptr;

  logger->info("Unbound device {} from driver {}", dev->p->name, bound->name);
}

size_t Core::getBoundCount() {
  std::lock_guard<std::mutex> guard(mutex);

  return std::count_if(devices.begin(), devices.end(),
                       [](struct device *d) { return d->driver != nullptr; });
}

size_t Core::getDeferredCount() {
  std::lock_guard<std::mutex> guard(mutex);

  return deferred.size();
}

int devbind::host::addDevres(struct device *dev, void (*action)(void *),
                             void *data) {
  if (!dev || !dev->p || !action)
    return -EINVAL;

  try {
    std::lock_guard<std::mutex> guard(dev->p->devresLock);

    dev->p->devres.emplace_back(action, data);
  } catch (const std::bad_alloc &) {
    return -ENOMEM;
  }

  return 0;
}

void devbind::host::releaseDevres(struct device *dev) {
  for (;;) {
    device_private::Action action;

    {
      std::lock_guard<std::mutex> guard(dev->p->devresLock);

      if (dev->p->devres.empty())
        break;

      action = dev->p->devres.back();
      dev->p->devres.pop_back();
    }

    action.first(action.second);
  }
}

// C interface

void device_initialize(struct device *dev) {
  dev->p = new (std::nothrow) device_private();
  if (!dev->p)
    Log::get("host:core")->error("Failed to allocate device");
}

int device_add(struct device *dev) { return Core::get().addDevice(dev); }

void device_del(struct device *dev) { Core::get().delDevice(dev); }

int device_register(struct device *dev) {
  device_initialize(dev);

  return device_add(dev);
}

void device_unregister(struct device *dev) {
  device_del(dev);
  put_device(dev);
}

struct device *get_device(struct device *dev) {
  if (dev && dev->p)
    dev->p->refcount++;

  return dev;
}

void put_device(struct device *dev) {
  if (!dev || !dev->p)
    return;

  if (--dev->p->refcount > 0)
    return;

  auto *p = dev->p;
  dev->p = nullptr;

  if (dev->release)
    dev->release(dev);
  else
    Log::get("host:core")
        ->error("Device {} does not have a release() function", p->name);

  delete p;
}

const char *dev_name(const struct device *dev) {
  if (dev->p && !dev->p->name.empty())
    return dev->p->name.c_str();

  return dev->init_name;
}

int dev_set_name(struct device *dev, const char *name) {
  if (!dev->p || !name)
    return -EINVAL;

  try {
    dev->p->name = name;
  } catch (const std::bad_alloc &) {
    return -ENOMEM;
  }

  return 0;
}

void *dev_get_drvdata(const struct device *dev) { return dev->driver_data; }

void dev_set_drvdata(struct device *dev, void *data) {
  dev->driver_data = data;
}

int driver_register(struct device_driver *drv) {
  int ret = consumeFault("driver_register");
  if (ret)
    return ret;

  return Core::get().addDriver(drv);
}

void driver_unregister(struct device_driver *drv) {
  Core::get().delDriver(drv);
}

int devm_add_action(struct device *dev, void (*action)(void *), void *data) {
  int ret = consumeFault("devm_add_action");
  if (ret)
    return ret;

  return addDevres(dev, action, data);
}

void devm_remove_action(struct device *dev, void (*action)(void *),
                        void *data) {
  if (!dev || !dev->p)
    return;

  std::lock_guard<std::mutex> guard(dev->p->devresLock);

  auto &devres = dev->p->devres;
  auto it = std::find(devres.rbegin(), devres.rend(),
                      device_private::Action(action, data));
  if (it != devres.rend())
    devres.erase(std::next(it).base());
}

int devm_release_action(struct device *dev, void (*action)(void *),
                        void *data) {
  if (!dev || !dev->p)
    return -EINVAL;

  {
    std::lock_guard<std::mutex> guard(dev->p->devresLock);

    auto &devres = dev->p->devres;
    auto it = std::find(devres.rbegin(), devres.rend(),
                        device_private::Action(action, data));
    if (it == devres.rend())
      return -ENOENT;

    devres.erase(std::next(it).base());
  }

  action(data);

  return 0;
}

size_t emu_bound_devices(void) { return Core::get().getBoundCount(); }

size_t emu_deferred_devices(void) { return Core::get().getDeferredCount(); }
