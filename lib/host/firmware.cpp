/* Emulated firmware loader.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <atomic>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <vector>

#include <devbind/config.hpp>
#include <devbind/host/emulation.h>
#include <devbind/utils.hpp>

#include "core.hpp"

using namespace devbind;

namespace {

using Blob = std::vector<uint8_t>;

// Allocation behind a struct firmware
struct FirmwareBuffer {
  struct firmware fw;
  Blob data;
};

enum Flags {
  FW_OPT_NOWARN = (1 << 0),
  FW_OPT_NOFALLBACK = (1 << 1),
};

std::mutex storeLock;
std::vector<std::string> searchPaths =
    utils::tokenize(DEVBIND_FIRMWARE_PATH, ":");
std::map<std::string, Blob> builtin;

std::atomic<size_t> outstanding(0);

std::optional<Blob> loadFromSearchPath(const std::string &name) {
  std::vector<std::string> paths;

  {
    std::lock_guard<std::mutex> guard(storeLock);

    paths = searchPaths;
  }

  for (auto &dir : paths) {
    auto path = fmt::format("{}/{}", dir, name);

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
      continue;

    Blob data((std::istreambuf_iterator<char>(f)),
              std::istreambuf_iterator<char>());
    if (f.bad())
      continue;

    Log::get("host:firmware")->debug("Loaded {} from {}", name, path);

    return data;
  }

  return std::nullopt;
}

std::optional<Blob> loadBuiltin(const std::string &name) {
  std::lock_guard<std::mutex> guard(storeLock);

  auto it = builtin.find(name);
  if (it == builtin.end())
    return std::nullopt;

  return it->second;
}

int request(const char *function, const struct firmware **fw,
            const char *name, struct device *device, int flags) {
  auto logger = Log::get("host:firmware");

  if (!fw)
    return -EINVAL;

  *fw = nullptr;

  if (!name || !name[0])
    return -EINVAL;

  int ret = host::consumeFault(function);
  if (ret)
    return ret;

  auto data = loadFromSearchPath(name);

  if (!data && !(flags & FW_OPT_NOFALLBACK))
    data = loadBuiltin(name);

  if (!data) {
    const char *devName = device ? dev_name(device) : "(none)";

    if (flags & FW_OPT_NOWARN)
      logger->debug("{}: Firmware {} not found", devName, name);
    else
      logger->warn("{}: Direct firmware load for {} failed with error {}",
                   devName, name, -ENOENT);

    return -ENOENT;
  }

  auto *buf = new FirmwareBuffer{};

  buf->data = std::move(*data);
  buf->fw.size = buf->data.size();
  buf->fw.data = buf->data.data();
  buf->fw.priv = buf;

  outstanding++;

  *fw = &buf->fw;

  return 0;
}

int requestNoexcept(const char *function, const struct firmware **fw,
                    const char *name, struct device *device, int flags) {
  try {
    return request(function, fw, name, device, flags);
  } catch (const std::bad_alloc &) {
    return -ENOMEM;
  }
}

} // namespace

int request_firmware(const struct firmware **fw, const char *name,
                     struct device *device) {
  return requestNoexcept("request_firmware", fw, name, device, 0);
}

int firmware_request_nowarn(const struct firmware **fw, const char *name,
                            struct device *device) {
  return requestNoexcept("firmware_request_nowarn", fw, name, device,
                         FW_OPT_NOWARN);
}

int request_firmware_direct(const struct firmware **fw, const char *name,
                            struct device *device) {
  return requestNoexcept("request_firmware_direct", fw, name, device,
                         FW_OPT_NOWARN | FW_OPT_NOFALLBACK);
}

void release_firmware(const struct firmware *fw) {
  if (!fw)
    return;

  delete static_cast<FirmwareBuffer *>(fw->priv);

  outstanding--;
}

int emu_firmware_set_search_path(const char *paths) {
  if (!paths)
    return -EINVAL;

  try {
    auto tokens = utils::tokenize(paths, ":");

    std::lock_guard<std::mutex> guard(storeLock);

    searchPaths = std::move(tokens);
  } catch (const std::bad_alloc &) {
    return -ENOMEM;
  }

  return 0;
}

int emu_firmware_add_builtin(const char *name, const uint8_t *data,
                             size_t size) {
  if (!name || !name[0] || (!data && size))
    return -EINVAL;

  try {
    Blob blob(data, data + size);

    std::lock_guard<std::mutex> guard(storeLock);

    builtin[name] = std::move(blob);
  } catch (const std::bad_alloc &) {
    return -ENOMEM;
  }

  return 0;
}

size_t emu_firmware_outstanding(void) { return outstanding; }
