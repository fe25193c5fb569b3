// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>

#include "hps/core/device.h"

namespace hps {
namespace memory {

// Physical capacity and current usage of a device, as the process sees it.
class MemoryInfo {
 public:
  virtual ~MemoryInfo() = default;

  virtual std::size_t total_bytes(const core::Device& device) const = 0;
  // Everything in use on the device: chunks, activations, workspaces.
  virtual std::size_t used_bytes(const core::Device& device) const = 0;
};

// Host: sysconf physical pages, and the larger of the /proc/self/statm
// resident set and the bytes held by cpu::Allocator.
// Accelerator: cudaMemGetInfo when built with HPS_WITH_CUDA, otherwise zero.
class SystemMemoryInfo final : public MemoryInfo {
 public:
  std::size_t total_bytes(const core::Device& device) const override;
  std::size_t used_bytes(const core::Device& device) const override;
};

} // namespace memory
} // namespace hps
