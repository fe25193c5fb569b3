// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

// Reuse DLPack enums for device type
#include <dlpack/dlpack.h>

namespace hps {
namespace core {

struct Device {
  DLDeviceType type{kDLCPU};
  int32_t index{0};

  static constexpr Device cpu(int32_t idx = 0) { return Device{kDLCPU, idx}; }
  static constexpr Device cuda(int32_t idx = 0) { return Device{kDLCUDA, idx}; }

  constexpr bool is_cpu() const noexcept { return type == kDLCPU; }
  constexpr bool is_cuda() const noexcept { return type == kDLCUDA; }

  std::string to_string() const {
    switch (type) {
      case kDLCPU:  return std::string("cpu:")  + std::to_string(index);
      case kDLCUDA: return std::string("cuda:") + std::to_string(index);
      default:      return std::string("unknown:") + std::to_string(index);
    }
  }
  friend inline bool operator==(const Device& a, const Device& b) {
    return a.type == b.type && a.index == b.index;
  }
  friend inline bool operator!=(const Device& a, const Device& b) { return !(a == b); }
};

// Memory tier a device belongs to. Budgets and occupancy are tracked per tier.
enum class DeviceClass : uint8_t {
  Cpu = 0,
  Accelerator = 1,
};

inline constexpr const char* to_string(DeviceClass c) noexcept {
  return c == DeviceClass::Cpu ? "cpu" : "accelerator";
}

// Throws HpsError(UnsupportedDevice) for anything outside {cpu, cuda}.
DeviceClass device_class(const Device& d);

} // namespace core
} // namespace hps

