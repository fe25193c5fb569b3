// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "hps/chunk/chunk_list.h"
#include "hps/core/device.h"
#include "hps/manager/config.h"
#include "hps/manager/metronome.h"
#include "hps/memory/memory_info.h"

namespace hps {
namespace manager {

// Byte multipliers applied to the default chunk size (counted in elements).
// Communication buffers hold one fp16 chunk per rank; the optimizer stage
// keeps four fp32 chunks of scratch; one full set of optimizer state is an
// fp32 master copy plus first and second moments.
inline constexpr std::int64_t kCommBufferBytesPerElement = 2;
inline constexpr std::int64_t kAdamScratchBytesPerElement = 4 * 4;
inline constexpr std::int64_t kOptimizerStateBytesPerElement = 3 * 4;

// What MemoryManager::tiktac needs from the orchestrator driving it.
class TiktacContext {
 public:
  virtual ~TiktacContext() = default;

  virtual Metronome& metronome() = 0;
  virtual const chunk::ChunkList& chunk_list() const = 0;
  virtual const core::Device& accelerator() const = 0;
  // Migrates every victim off `from`, one move at a time.
  virtual void evict(const std::vector<chunk::ChunkId>& victims, const core::Device& from) = 0;
};

// Per-moment samples recorded during warmup for one device class.
struct MemoryTrace {
  std::vector<std::int64_t> used{};        // everything in use on the device
  std::vector<std::int64_t> chunk_used{};  // chunk payloads only
  std::vector<std::int64_t> sys_used{};    // used - chunk_used

  void clear() { used.clear(); chunk_used.clear(); sys_used.clear(); }
};

// Device budgets and memory forecasting for one process. Construct one per
// process and pass it by reference to the client.
class MemoryManager {
 public:
  MemoryManager(const ManagerConfig& cfg, const memory::MemoryInfo& info);

  MemoryManager(const MemoryManager&) = delete;
  MemoryManager& operator=(const MemoryManager&) = delete;

  void set_training_stage(TrainingStage stage);
  TrainingStage training_stage() const noexcept { return stage_; }

  // Begins the warmup iteration. param_budget_bytes is the accelerator
  // memory committed to parameter chunks; chunk_size counts elements.
  void start_train(Metronome& metronome, std::size_t param_budget_bytes, std::size_t chunk_size);
  bool training_started() const noexcept { return start_training_; }

  // After backward: how many more accelerator chunks the optimizer stage
  // can hold. Throws HpsError(IncompleteTrace) if no warmup samples exist.
  void update_margin_mem();
  std::int64_t margin_chunk_num_for_adam() const noexcept { return margin_chunk_num_for_adam_; }

  // Drops both traces. Forecasts throw IncompleteTrace until a new warmup
  // has recorded them again.
  void reset_memory_stats();

  // Records (warmup) or forecasts and pre-evicts (steady state), then
  // advances the metronome.
  void tiktac(TiktacContext& ctx);

  // Chunk occupancy bookkeeping.
  void add(const core::Device& device, std::size_t nbytes);
  void remove(const core::Device& device, std::size_t nbytes);
  std::size_t used_chunk_mem(const core::Device& device) const;

  // Budget a device class may spend on chunks at the current moment.
  std::int64_t available_chunk_mem(const Metronome& metronome, const core::Device& device) const;
  std::int64_t free_chunk_mem(const Metronome& metronome, const core::Device& device) const;
  // Total configured budget of the device class.
  std::size_t max_mem(const core::Device& device) const;

  const MemoryTrace& trace(core::DeviceClass c) const noexcept {
    return c == core::DeviceClass::Cpu ? cpu_trace_ : gpu_trace_;
  }
  const ManagerConfig& config() const noexcept { return cfg_; }
  std::size_t default_chunk_size() const noexcept { return default_chunk_size_; }

 private:
  std::int64_t sys_used_at(std::size_t moment) const;

  ManagerConfig cfg_;
  const memory::MemoryInfo* info_;

  std::size_t overall_gpu_mem_{0};
  std::size_t overall_cpu_mem_{0};
  std::size_t gpu_chunk_used_mem_{0};
  std::size_t cpu_chunk_used_mem_{0};

  MemoryTrace gpu_trace_{};
  MemoryTrace cpu_trace_{};

  bool start_training_{false};
  TrainingStage stage_{TrainingStage::Unstart};
  std::size_t param_budget_bytes_{0};
  std::size_t default_chunk_size_{0};
  std::int64_t margin_chunk_num_for_adam_{0};
};

} // namespace manager
} // namespace hps
