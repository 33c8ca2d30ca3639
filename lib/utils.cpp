/* Utilities.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cstring>

#include <devbind/log.hpp>
#include <devbind/utils.hpp>

namespace devbind {
namespace utils {

std::vector<std::string> tokenize(std::string s, const std::string &delimiter) {
  std::vector<std::string> tokens;

  size_t lastPos = 0;
  size_t curentPos;

  while ((curentPos = s.find(delimiter, lastPos)) != std::string::npos) {
    const size_t tokenLength = curentPos - lastPos;
    tokens.push_back(s.substr(lastPos, tokenLength));

    // Advance in string
    lastPos = curentPos + delimiter.length();
  }

  // Check if there's a last token behind the last delimiter.
  if (lastPos != s.length()) {
    const size_t lastTokenLength = s.length() - lastPos;
    tokens.push_back(s.substr(lastPos, lastTokenLength));
  }

  return tokens;
}

bool copyName(char *dst, size_t size, const std::string &src) {
  if (size == 0)
    return src.empty();

  size_t len = std::min(src.size(), size - 1);

  memcpy(dst, src.data(), len);
  memset(dst + len, 0, size - len);

  return len == src.size();
}

int signalsInit(void (*cb)(int signal, siginfo_t *sinfo, void *ctx),
                std::list<int> cbSignals, std::list<int> ignoreSignals) {
  int ret;

  Logger logger = Log::get("signals");

  logger->debug("Initialize subsystem");

  struct sigaction sa_cb;
  sa_cb.sa_flags = SA_SIGINFO | SA_NODEFER;
  sa_cb.sa_sigaction = cb;

  struct sigaction sa_ign;
  sa_ign.sa_flags = 0;
  sa_ign.sa_handler = SIG_IGN;

  sigemptyset(&sa_cb.sa_mask);
  sigemptyset(&sa_ign.sa_mask);

  cbSignals.insert(cbSignals.begin(), {SIGINT, SIGTERM});
  cbSignals.sort();
  cbSignals.unique();

  for (auto signal : cbSignals) {
    ret = sigaction(signal, &sa_cb, nullptr);
    if (ret)
      return ret;
  }

  for (auto signal : ignoreSignals) {
    ret = sigaction(signal, &sa_ign, nullptr);
    if (ret)
      return ret;
  }

  return 0;
}

} // namespace utils
} // namespace devbind
