/* Open Firmware (device tree) matching.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <devbind/host/bindings.h>
#include <devbind/kernel/error.hpp>

namespace devbind {
namespace kernel {
namespace of {

// An Open Firmware compatible string, e.g. "vendor,device".
class DeviceId {

public:
  using RawType = struct of_device_id;

  static constexpr size_t capacity = OF_COMPATIBLE_SIZE - 1;

protected:
  char compatible[OF_COMPATIBLE_SIZE];

public:
  template <size_t M>
  constexpr DeviceId(const char (&compat)[M]) : compatible{} {
    static_assert(M - 1 <= capacity, "Compatible string is too long");

    for (size_t i = 0; i < M - 1; i++)
      compatible[i] = compat[i];
  }

  explicit constexpr DeviceId(std::string_view compat) : compatible{} {
    if (compat.size() > capacity)
      throw Error(EINVAL, "Compatible string is too long: {}", compat);

    for (size_t i = 0; i < compat.size(); i++)
      compatible[i] = compat[i];
  }

  std::string_view getCompatible() const { return compatible; }

  // Encode the id as a raw record whose reserved field stores offset.
  RawType toRawId(ptrdiff_t offset) const;

  static ptrdiff_t rawOffset(const RawType &raw) {
    return static_cast<ptrdiff_t>(reinterpret_cast<intptr_t>(raw.data));
  }

  static bool isSentinel(const RawType &raw) {
    return !raw.name[0] && !raw.type[0] && !raw.compatible[0];
  }
};

} // namespace of
} // namespace kernel
} // namespace devbind
