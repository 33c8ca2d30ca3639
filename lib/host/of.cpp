/* Emulated Open Firmware matching.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>

#include <devbind/host/bindings.h>

static bool isSentinel(const struct of_device_id *id) {
  return !id->name[0] && !id->type[0] && !id->compatible[0];
}

const struct of_device_id *of_match_device(const struct of_device_id *matches,
                                           const struct device *dev) {
  if (!matches || !dev || !dev->of_node || !dev->of_node->compatible[0])
    return nullptr;

  for (auto *id = matches; !isSentinel(id); id++) {
    if (!strcmp(id->compatible, dev->of_node->compatible))
      return id;
  }

  return nullptr;
}
