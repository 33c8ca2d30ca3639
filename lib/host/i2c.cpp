/* Emulated I2C core.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>
#include <list>
#include <mutex>
#include <new>

#include <devbind/utils.hpp>

#include "core.hpp"

using namespace devbind;

namespace {

struct ClientInstance {
  struct i2c_client client;
  struct device_node node;
};

std::mutex clientsLock;
std::list<struct i2c_client *> clients;

struct i2c_client *toClient(struct device *dev) {
  return container_of(dev, struct i2c_client, dev);
}

struct i2c_driver *toDriver(struct device_driver *drv) {
  return container_of(drv, struct i2c_driver, driver);
}

int i2cDeviceMatch(struct device *dev, struct device_driver *drv) {
  if (of_match_device(drv->of_match_table, dev))
    return 1;

  if (i2c_match_id(toDriver(drv)->id_table, toClient(dev)))
    return 1;

  return 0;
}

int i2cDeviceProbe(struct device *dev) {
  auto *driver = toDriver(dev->driver);
  if (!driver->probe_new)
    return -ENODEV;

  return driver->probe_new(toClient(dev));
}

int i2cDeviceRemove(struct device *dev) {
  auto *driver = toDriver(dev->driver);
  if (!driver->remove)
    return 0;

  return driver->remove(toClient(dev));
}

void i2cClientRelease(struct device *dev) {
  auto *client = toClient(dev);

  delete container_of(client, ClientInstance, client);
}

int checkAddress(unsigned short addr, unsigned short flags) {
  if (flags & I2C_CLIENT_TEN) {
    // 10-bit address, all values are valid
    if (addr > 0x3ff)
      return -EINVAL;
  } else {
    // 7-bit address, reject the general call address
    if (addr == 0x00 || addr > 0x7f)
      return -EINVAL;
  }

  return 0;
}

bool isBusy(struct device *parent, unsigned short addr, unsigned short flags) {
  for (auto *c : clients) {
    if (c->dev.parent == parent && c->addr == addr &&
        (c->flags & I2C_CLIENT_TEN) == (flags & I2C_CLIENT_TEN))
      return true;
  }

  return false;
}

} // namespace

struct bus_type i2c_bus_type = {
    "i2c",
    i2cDeviceMatch,
    i2cDeviceProbe,
    i2cDeviceRemove,
};

int i2c_register_driver(struct module *owner, struct i2c_driver *driver) {
  int ret = host::consumeFault("i2c_register_driver");
  if (ret)
    return ret;

  driver->driver.owner = owner;
  driver->driver.bus = &i2c_bus_type;

  ret = driver_register(&driver->driver);
  if (ret)
    return ret;

  Log::get("host:i2c")->debug("Registered driver {}", driver->driver.name);

  return 0;
}

void i2c_del_driver(struct i2c_driver *driver) {
  driver_unregister(&driver->driver);

  Log::get("host:i2c")->debug("Unregistered driver {}", driver->driver.name);
}

const struct i2c_device_id *i2c_match_id(const struct i2c_device_id *id,
                                         const struct i2c_client *client) {
  if (!id || !client)
    return nullptr;

  for (; id->name[0]; id++) {
    if (!strcmp(client->name, id->name))
      return id;
  }

  return nullptr;
}

namespace {

struct i2c_client *newClientDevice(struct device *parent,
                                   const struct i2c_board_info *info) {
  auto logger = Log::get("host:i2c");

  if (!info)
    return static_cast<struct i2c_client *>(ERR_PTR(-EINVAL));

  int ret = host::consumeFault("i2c_new_client_device");
  if (ret)
    return static_cast<struct i2c_client *>(ERR_PTR(ret));

  ret = checkAddress(info->addr, info->flags);
  if (ret) {
    logger->error("Invalid {}-bit I2C address 0x{:02x}",
                  info->flags & I2C_CLIENT_TEN ? 10 : 7, info->addr);
    return static_cast<struct i2c_client *>(ERR_PTR(ret));
  }

  auto *inst = new (std::nothrow) ClientInstance{};
  if (!inst)
    return static_cast<struct i2c_client *>(ERR_PTR(-ENOMEM));

  auto *client = &inst->client;

  client->flags = info->flags;
  client->addr = info->addr;
  memcpy(client->name, info->type, sizeof(client->name));
  client->name[I2C_NAME_SIZE - 1] = '\0';

  if (info->of_compatible) {
    if (!utils::copyName(inst->node.compatible, sizeof(inst->node.compatible),
                         info->of_compatible)) {
      delete inst;
      return static_cast<struct i2c_client *>(ERR_PTR(-EINVAL));
    }

    memcpy(inst->node.full_name, client->name, sizeof(client->name));
    client->dev.of_node = &inst->node;
  }

  device_initialize(&client->dev);
  if (!client->dev.p) {
    delete inst;
    return static_cast<struct i2c_client *>(ERR_PTR(-ENOMEM));
  }

  client->dev.parent = parent;
  client->dev.bus = &i2c_bus_type;
  client->dev.release = i2cClientRelease;

  unsigned short encoded =
      client->addr | ((client->flags & I2C_CLIENT_TEN) ? 0xa000 : 0);

  ret = dev_set_name(&client->dev, fmt::format("0-{:04x}", encoded).c_str());
  if (ret) {
    put_device(&client->dev);
    return static_cast<struct i2c_client *>(ERR_PTR(ret));
  }

  {
    std::lock_guard<std::mutex> guard(clientsLock);

    if (isBusy(parent, client->addr, client->flags)) {
      logger->error("Address 0x{:02x} is already in use", client->addr);
      put_device(&client->dev);
      return static_cast<struct i2c_client *>(ERR_PTR(-EBUSY));
    }

    clients.push_back(client);
  }

  ret = device_add(&client->dev);
  if (ret) {
    {
      std::lock_guard<std::mutex> guard(clientsLock);

      clients.remove(client);
    }

    logger->error("Failed to register I2C client {} at 0x{:02x} ({})",
                  client->name, client->addr, ret);
    put_device(&client->dev);
    return static_cast<struct i2c_client *>(ERR_PTR(ret));
  }

  logger->info("Instantiated device {} at 0x{:02x}", client->name,
               client->addr);

  return client;
}

} // namespace

struct i2c_client *i2c_new_client_device(struct device *parent,
                                         const struct i2c_board_info *info) {
  try {
    return newClientDevice(parent, info);
  } catch (const std::bad_alloc &) {
    return static_cast<struct i2c_client *>(ERR_PTR(-ENOMEM));
  }
}

void i2c_unregister_device(struct i2c_client *client) {
  if (IS_ERR_OR_NULL(client))
    return;

  {
    std::lock_guard<std::mutex> guard(clientsLock);

    clients.remove(client);
  }

  device_unregister(&client->dev);
}
