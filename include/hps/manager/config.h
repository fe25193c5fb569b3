// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace hps {
namespace manager {

enum class TrainingStage : std::uint8_t {
  Unstart = 0,
  Warmup = 1,
  Fwd = 2,
  Bwd = 3,
  Adam = 4,
};

inline constexpr const char* to_string(TrainingStage s) noexcept {
  switch (s) {
    case TrainingStage::Unstart: return "UNSTART";
    case TrainingStage::Warmup: return "WARMUP";
    case TrainingStage::Fwd: return "FWD";
    case TrainingStage::Bwd: return "BWD";
    case TrainingStage::Adam: return "ADAM";
  }
  return "UNKNOWN";
}

struct ManagerConfig {
  double overall_gpu_mem_ratio{0.8};
  double overall_cpu_mem_ratio{0.8};
  double margin_use_ratio{0.8};
  double warmup_gpu_chunk_mem_ratio{0.2};
  // All ranks share one accelerator; its budget is split by world_size too.
  bool use_fake_dist{false};
  bool always_warmup{false};
  int world_size{1};
  int local_rank{0};
  // Physical capacity overrides; 0 means query the device.
  std::size_t gpu_capacity_bytes{0};
  std::size_t cpu_capacity_bytes{0};

  // Throws std::invalid_argument on out-of-range values.
  void validate() const;

  // Parses HPS_MANAGER_CONF (comma separated key=value) over the defaults.
  static ManagerConfig from_env();
  static ManagerConfig parse(const std::string& conf);
};

} // namespace manager
} // namespace hps
