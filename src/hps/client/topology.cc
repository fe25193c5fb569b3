// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "hps/client/topology.h"

#include <stdexcept>

#include "hps/core/error.h"

namespace hps {
namespace client {

void DeviceTopology::add_route(const core::Device& from, const core::Device& to) {
  (void)core::device_class(from);
  (void)core::device_class(to);
  if (from == to) {
    throw std::invalid_argument("DeviceTopology::add_route: " + from.to_string() + " cannot evict to itself");
  }
  for (auto& r : routes_) {
    if (r.first == from) { r.second = to; return; }
  }
  routes_.emplace_back(from, to);
}

core::Device DeviceTopology::evict_target(const core::Device& from) const {
  for (const auto& r : routes_) {
    if (r.first == from) return r.second;
  }
  throw core::unsupported_device(from, "DeviceTopology::evict_target: no eviction route");
}

DeviceTopology DeviceTopology::two_tier(const core::Device& accelerator, const core::Device& host) {
  DeviceTopology t;
  t.add_route(accelerator, host);
  t.add_route(host, accelerator);
  return t;
}

} // namespace client
} // namespace hps
