/* Internal interface of the emulated host driver core.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <utility>

#include <devbind/host/bindings.h>
#include <devbind/log.hpp>

#define container_of(ptr, type, member)                                        \
  reinterpret_cast<type *>(reinterpret_cast<char *>(ptr) -                     \
                           offsetof(type, member))

struct device_private {
  using Action = std::pair<void (*)(void *), void *>;

  // Serializes probe, remove and RTC operations of the device
  std::mutex lock;

  std::atomic<int> refcount;
  std::string name;
  bool added;

  std::mutex devresLock;
  std::list<Action> devres;

  device_private() : refcount(1), added(false) {}
};

namespace devbind {
namespace host {

class Core {

protected:
  std::mutex mutex;

  std::list<struct device *> devices;
  std::list<struct device_driver *> drivers;
  std::list<struct device *> deferred;

  Logger logger;

  Core();

  // Try to bind dev to one of the registered drivers.
  //
  // @return true if a driver has been bound.
  bool attach(struct device *dev);

  int probe(struct device *dev, struct device_driver *drv);

  // Retry deferred devices as long as this binds new devices.
  void triggerDeferred();

  // Unbind dev if it is bound to drv, or to any driver if drv is nullptr.
  void release(struct device *dev, struct device_driver *drv = nullptr);

public:
  static Core &get();

  int addDevice(struct device *dev);
  void delDevice(struct device *dev);

  int addDriver(struct device_driver *drv);
  void delDriver(struct device_driver *drv);

  size_t getBoundCount();
  size_t getDeferredCount();
};

// Add a device-managed action without fault injection.
int addDevres(struct device *dev, void (*action)(void *), void *data);

// Run all device-managed actions of dev in reverse order.
void releaseDevres(struct device *dev);

// Consume an injected fault of the host entry point function.
//
// @return The injected negative errno, or 0 if none is pending.
int consumeFault(const char *function);

} // namespace host
} // namespace devbind
