// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <utility>
#include <vector>

#include "hps/core/device.h"

namespace hps {
namespace client {

// Where chunks evicted from a device go. Each source device has exactly one
// eviction target.
class DeviceTopology {
 public:
  // Replaces any existing route from `from`. Throws HpsError(UnsupportedDevice)
  // for devices outside {cpu, cuda} and std::invalid_argument if from == to.
  void add_route(const core::Device& from, const core::Device& to);

  // Throws HpsError(UnsupportedDevice) when no route leaves `from`.
  core::Device evict_target(const core::Device& from) const;

  const std::vector<std::pair<core::Device, core::Device>>& routes() const noexcept { return routes_; }

  // accelerator -> host and host -> accelerator.
  static DeviceTopology two_tier(const core::Device& accelerator,
                                 const core::Device& host = core::Device::cpu());

 private:
  std::vector<std::pair<core::Device, core::Device>> routes_{};
};

} // namespace client
} // namespace hps
