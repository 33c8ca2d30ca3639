/* Utilities.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <list>
#include <string>
#include <vector>

#include <signal.h>

namespace devbind {
namespace utils {

std::vector<std::string> tokenize(std::string s, const std::string &delimiter);

// Copy a string into a fixed size, zero terminated character buffer.
//
// @return false if the string had to be truncated.
bool copyName(char *dst, size_t size, const std::string &src);

// Setup exit handler
int signalsInit(void (*cb)(int signal, siginfo_t *sinfo, void *ctx),
                std::list<int> cbSignals = {},
                std::list<int> ignoreSignals = {SIGCHLD});

} // namespace utils
} // namespace devbind
