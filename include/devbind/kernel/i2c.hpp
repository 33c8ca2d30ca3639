/* I2C client drivers.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string_view>
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
namespace i2c {

// An I2C device name as matched against the name of a client.
class DeviceId {

public:
  using RawType = struct i2c_device_id;

  static constexpr size_t capacity = I2C_NAME_SIZE - 1;

protected:
  char name[I2C_NAME_SIZE];

public:
  template <size_t M> constexpr DeviceId(const char (&n)[M]) : name{} {
    static_assert(M - 1 <= capacity, "I2C device name is too long");

    for (size_t i = 0; i < M - 1; i++)
      name[i] = n[i];
  }

  explicit constexpr DeviceId(std::string_view n) : name{} {
    if (n.size() > capacity)
      throw Error(EINVAL, "I2C device name is too long: {}", n);

    for (size_t i = 0; i < n.size(); i++)
      name[i] = n[i];
  }

  std::string_view getName() const { return name; }

  // Encode the id as a raw record whose reserved field stores offset.
  RawType toRawId(ptrdiff_t offset) const;

  static ptrdiff_t rawOffset(const RawType &raw) {
    return static_cast<ptrdiff_t>(raw.driver_data);
  }

  static bool isSentinel(const RawType &raw) { return !raw.name[0]; }
};

// An I2C client as passed to the callbacks of a driver.
//
// Only valid for the duration of the callback. Use device::Device to retain a
// reference beyond that.
class Client : public device::RawDevice {

protected:
  struct i2c_client *client;

public:
  explicit Client(struct i2c_client *c) : client(c) {}

  Client(const Client &) = delete;
  Client(Client &&) = delete;
  Client &operator=(const Client &) = delete;
  Client &operator=(Client &&) = delete;

  struct ::device *rawDevice() const override { return &client->dev; }

  struct i2c_client *raw() const { return client; }

  unsigned short addr() const { return client->addr; }

  bool isTenBit() const { return client->flags & I2C_CLIENT_TEN; }

  std::string_view getType() const { return client->name; }
};

// Defaults for I2C drivers.
//
// Drivers derive from this class and override what they need:
//
//   using Data = ...;                // Owned per-device data
//   using IdInfo = ...;              // Context of ofIdTable entries
//   using DeviceIdInfo = ...;        // Context of idTable entries
//   static const driver::IdArray<of::DeviceId, IdInfo, N> ofIdTable;
//   static const driver::IdArray<i2c::DeviceId, DeviceIdInfo, M> idTable;
//   static Data probe(Client &, const IdInfo *, const DeviceIdInfo *);
//   static void remove(Data &);
//
// Both tables and remove() are optional. The data must be safe to use from
// any thread as the host invokes the callbacks from its own threads.
class Driver {

public:
  using Data = std::monostate;
  using IdInfo = std::monostate;
  using DeviceIdInfo = std::monostate;
};

// Registers a driver T with the I2C core.
template <typename T> class DriverAdapter {

public:
  using RegType = struct i2c_driver;
  using Data = typename T::Data;
  using Wrapper = PointerWrapper<Data>;

  static void registerDriver(RegType &reg, const char *name,
                             struct module *module) {
    reg.driver.name = name;
    reg.probe_new = probeCallback;
    reg.remove = removeCallback;

    if constexpr (driver::HasOfIdTable<T>::value)
      reg.driver.of_match_table = T::ofIdTable.table().asRaw();

    if constexpr (driver::HasIdTable<T>::value)
      reg.id_table = T::idTable.table().asRaw();

    toResult(i2c_register_driver(module, &reg));

    Log::get("kernel:i2c")->debug("Registered driver: {}", name);
  }

  static void unregisterDriver(RegType &reg) {
    i2c_del_driver(&reg);

    Log::get("kernel:i2c")->debug("Unregistered driver: {}", reg.driver.name);
  }

protected:
  static int probeCallback(struct i2c_client *c) {
    return fromKernelResult([c] {
      Client client(c);

      const typename T::IdInfo *info = nullptr;
      const typename T::DeviceIdInfo *idInfo = nullptr;

      if constexpr (driver::HasOfIdTable<T>::value) {
        auto table = T::ofIdTable.table();
        info = table.info(of_match_device(table.asRaw(), &c->dev));
      }

      if constexpr (driver::HasIdTable<T>::value) {
        auto table = T::idTable.table();
        idInfo = table.info(i2c_match_id(table.asRaw(), c));
      }

      Data data = T::probe(client, info, idInfo);

      i2c_set_clientdata(c, Wrapper::intoPointer(std::move(data)));
    });
  }

  static int removeCallback(struct i2c_client *c) {
    // Take the data back first, it is dropped in any case
    void *ptr = i2c_get_clientdata(c);
    i2c_set_clientdata(c, nullptr);

    Data data = Wrapper::fromPointer(ptr);

    int ret = fromKernelResult([&data] {
      if constexpr (driver::HasRemove<T>::value)
        T::remove(data);
    });

    int hookRet = fromKernelResult([&data] { driver::deviceRemove(data); });
    if (hookRet)
      Log::get("kernel:i2c")
          ->warn("Device removal hook of {} failed: {}", dev_name(&c->dev),
                 hookRet);

    return ret;
  }
};

} // namespace i2c
} // namespace kernel
} // namespace devbind
