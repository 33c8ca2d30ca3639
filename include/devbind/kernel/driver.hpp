/* Generic support for drivers of different buses.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include <devbind/host/bindings.h>
#include <devbind/kernel/error.hpp>
#include <devbind/kernel/types.hpp>

namespace devbind {
namespace kernel {
namespace driver {

// A non-owning view of an id table as registered with the host.
//
// T is the device id type (i2c::DeviceId, of::DeviceId), U the type of the
// context information attached to the entries.
template <typename T, typename U> class IdTable {

public:
  using RawType = typename T::RawType;

protected:
  const RawType *ids;

public:
  explicit IdTable(const RawType *i) : ids(i) {}

  // The zero terminated raw array handed over to the host.
  const RawType *asRaw() const { return ids; }

  // Number of entries in front of the sentinel.
  size_t size() const {
    size_t n = 0;
    while (!T::isSentinel(ids[n]))
      n++;

    return n;
  }

  // Get the context information of an entry found by a host lookup.
  //
  // The id must be an element of a table built by IdArray, or nullptr if the
  // host did not find a match.
  static const U *info(const RawType *id) {
    if (!id)
      return nullptr;

    auto offset = T::rawOffset(*id);
    if (offset == 0)
      return nullptr;

    auto *ptr = reinterpret_cast<const char *>(id) + offset;

    return reinterpret_cast<const U *>(ptr);
  }
};

// An id table together with the context information of its entries.
//
// The raw ids are laid out as the contiguous, zero terminated array expected
// by the host. The reserved field of every raw id holds the byte offset from
// the id to its context information, or zero if the entry has none.
template <typename T, typename U, size_t N> class IdArray {

public:
  using RawType = typename T::RawType;

  struct Entry {
    T id;
    std::optional<U> info = std::nullopt;
  };

protected:
  RawType ids[N + 1];
  std::optional<U> infos[N];

public:
  IdArray(const Entry (&entries)[N]) : ids{}, infos{} {
    for (size_t i = 0; i < N; i++) {
      infos[i] = entries[i].info;

      ptrdiff_t offset = 0;
      if (infos[i])
        offset = reinterpret_cast<const char *>(&*infos[i]) -
                 reinterpret_cast<const char *>(&ids[i]);

      ids[i] = entries[i].id.toRawId(offset);
    }
  }

  // The offsets are only valid for this instance
  IdArray(const IdArray &) = delete;
  IdArray &operator=(const IdArray &) = delete;

  IdTable<T, U> table() const { return IdTable<T, U>(ids); }
};

// Detect optional members of a driver
template <typename T, typename = void>
struct HasOfIdTable : std::false_type {};

template <typename T>
struct HasOfIdTable<T, std::void_t<decltype(T::ofIdTable.table())>>
    : std::true_type {};

template <typename T, typename = void> struct HasIdTable : std::false_type {};

template <typename T>
struct HasIdTable<T, std::void_t<decltype(T::idTable.table())>>
    : std::true_type {};

template <typename T, typename = void> struct HasRemove : std::false_type {};

template <typename T>
struct HasRemove<T, std::void_t<decltype(T::remove(
                        std::declval<typename T::Data &>()))>>
    : std::true_type {};

template <typename D, typename = void>
struct HasDeviceRemove : std::false_type {};

template <typename D>
struct HasDeviceRemove<D, std::void_t<decltype(std::declval<D &>().deviceRemove())>>
    : std::true_type {};

// Invoke the device removal hook of driver data, if it has one.
template <typename D> void deviceRemove(std::unique_ptr<D> &data) {
  if constexpr (HasDeviceRemove<D>::value) {
    if (data)
      data->deviceRemove();
  }
}

template <typename D> void deviceRemove(std::shared_ptr<D> &data) {
  if constexpr (HasDeviceRemove<D>::value) {
    if (data)
      data->deviceRemove();
  }
}

inline void deviceRemove(std::monostate &) {}

// Owns the registration record of a driver with the host.
//
// A is the bus adapter, e.g. i2c::DriverAdapter<MyDriver>. The host keeps the
// address of the record while registered, so instances are only handed out
// on the heap and can neither be copied nor moved.
template <typename A> class Registration {

protected:
  typename A::RegType reg;
  std::string name;
  bool registered;

  Registration() : reg{}, registered(false) {}

public:
  static std::unique_ptr<Registration> create(const std::string &name,
                                              struct module *module) {
    auto r = std::unique_ptr<Registration>(new Registration());

    r->registerDriver(name, module);

    return r;
  }

  Registration(const Registration &) = delete;
  Registration &operator=(const Registration &) = delete;

  ~Registration() {
    if (registered)
      A::unregisterDriver(reg);
  }

  void registerDriver(const std::string &nme, struct module *module) {
    if (registered)
      throw Error(EINVAL, "Driver {} is already registered", name);

    name = nme;

    A::registerDriver(reg, name.c_str(), module);

    registered = true;
  }

  bool isRegistered() const { return registered; }

  const std::string &getName() const { return name; }

  typename A::RegType *raw() { return &reg; }
};

} // namespace driver
} // namespace kernel
} // namespace devbind
