/* Kernel error codes.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cerrno>
#include <exception>
#include <new>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include <devbind/host/bindings.h>

namespace devbind {
namespace kernel {

// An error reported by or to the host kernel.
//
// Carries a positive errno value. Host entry points report errors as negative
// integers or as ERR_PTR() encoded pointers.
class Error : public std::system_error {

public:
  explicit Error(int err)
      : std::system_error(err < 0 ? -err : err, std::generic_category()) {}

  template <typename... Args>
  Error(int err, const std::string &what, Args &&...args)
      : std::system_error(err < 0 ? -err : err, std::generic_category(),
                          fmt::format(what, std::forward<Args>(args)...)) {}

  int getErrno() const { return code().value(); }

  // Get the negative errno as expected by the host.
  int toKernelErrno() const { return -code().value(); }
};

// Raise an error for negative return values of host entry points.
inline int toResult(int ret) {
  if (ret < 0)
    throw Error(ret);

  return ret;
}

// Raise an error for ERR_PTR() encoded pointers.
template <typename T> T *fromErrPtr(T *ptr) {
  if (IS_ERR(ptr))
    throw Error(static_cast<int>(PTR_ERR(ptr)));

  return ptr;
}

void logUnexpectedException(const std::exception &e);

// Run f and convert its outcome into a host return code.
//
// Exceptions must never unwind through the C frames of the host.
template <typename F> int fromKernelResult(F &&f) noexcept {
  try {
    f();

    return 0;
  } catch (const Error &e) {
    return e.toKernelErrno();
  } catch (const std::bad_alloc &) {
    return -ENOMEM;
  } catch (const std::exception &e) {
    logUnexpectedException(e);

    return -EINVAL;
  }
}

} // namespace kernel
} // namespace devbind
