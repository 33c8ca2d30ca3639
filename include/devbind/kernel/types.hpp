/* Ownership transfer through opaque pointers.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <variant>

namespace devbind {
namespace kernel {

// Converts owned values into the opaque `void *` stored by the host and back.
//
// intoPointer() hands ownership over to the host. fromPointer() takes it back
// and must be called exactly once for every pointer returned by intoPointer().
// borrow() gives temporary access while the host keeps ownership.
template <typename T> struct PointerWrapper;

template <typename T> struct PointerWrapper<std::unique_ptr<T>> {
  using Borrowed = T &;

  static void *intoPointer(std::unique_ptr<T> data) { return data.release(); }

  static std::unique_ptr<T> fromPointer(void *ptr) {
    return std::unique_ptr<T>(static_cast<T *>(ptr));
  }

  static Borrowed borrow(void *ptr) { return *static_cast<T *>(ptr); }
};

template <typename T> struct PointerWrapper<std::shared_ptr<T>> {
  using Borrowed = const std::shared_ptr<T> &;

  // A shared_ptr is two words wide, so the host stores a pointer to a heap
  // allocated copy.
  static void *intoPointer(std::shared_ptr<T> data) {
    return new std::shared_ptr<T>(std::move(data));
  }

  static std::shared_ptr<T> fromPointer(void *ptr) {
    std::unique_ptr<std::shared_ptr<T>> holder(
        static_cast<std::shared_ptr<T> *>(ptr));
    if (!holder)
      return nullptr;

    return std::move(*holder);
  }

  static Borrowed borrow(void *ptr) {
    return *static_cast<const std::shared_ptr<T> *>(ptr);
  }
};

template <> struct PointerWrapper<std::monostate> {
  using Borrowed = std::monostate;

  static void *intoPointer(std::monostate) { return nullptr; }

  static std::monostate fromPointer(void *) { return {}; }

  static Borrowed borrow(void *) { return {}; }
};

// Read-only view of a contiguous range of bytes.
class ByteView {

protected:
  const uint8_t *ptr;
  size_t len;

public:
  ByteView(const uint8_t *p, size_t l) : ptr(p), len(l) {}

  const uint8_t *data() const { return ptr; }

  size_t size() const { return len; }

  bool empty() const { return len == 0; }

  const uint8_t *begin() const { return ptr; }

  const uint8_t *end() const { return ptr + len; }

  uint8_t operator[](size_t i) const { return ptr[i]; }
};

} // namespace kernel
} // namespace devbind
