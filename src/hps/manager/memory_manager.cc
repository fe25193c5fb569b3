// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "hps/manager/memory_manager.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "hps/core/error.h"
#include "hps/logging/logging.h"

namespace hps {
namespace manager {

namespace {
constexpr double kMB = 1e6;

std::int64_t as_i64(std::size_t v) { return static_cast<std::int64_t>(v); }
} // namespace

MemoryManager::MemoryManager(const ManagerConfig& cfg, const memory::MemoryInfo& info)
    : cfg_(cfg), info_(&info) {
  cfg_.validate();
  const std::size_t gpu_cap = cfg_.gpu_capacity_bytes != 0
      ? cfg_.gpu_capacity_bytes
      : info_->total_bytes(core::Device::cuda(cfg_.local_rank));
  const std::size_t cpu_cap = cfg_.cpu_capacity_bytes != 0
      ? cfg_.cpu_capacity_bytes
      : info_->total_bytes(core::Device::cpu());

  double gpu = static_cast<double>(gpu_cap) * cfg_.overall_gpu_mem_ratio;
  if (cfg_.use_fake_dist) gpu /= cfg_.world_size;
  const double cpu = static_cast<double>(cpu_cap) * cfg_.overall_cpu_mem_ratio / cfg_.world_size;
  overall_gpu_mem_ = static_cast<std::size_t>(gpu);
  overall_cpu_mem_ = static_cast<std::size_t>(cpu);

  HPS_LOG(INFO) << "Init MemoryManager: overall gpu mem " << overall_gpu_mem_ / kMB
                << " MB, cpu mem " << overall_cpu_mem_ / kMB << " MB (world size "
                << cfg_.world_size << ", local rank " << cfg_.local_rank << ")";
}

void MemoryManager::set_training_stage(TrainingStage stage) {
  stage_ = stage;
  HPS_LOG(INFO) << "Enter " << to_string(stage_);
}

void MemoryManager::start_train(Metronome& metronome, std::size_t param_budget_bytes,
                                std::size_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("MemoryManager::start_train: chunk_size must be positive");
  }
  metronome.set_warmup(true);
  start_training_ = true;
  param_budget_bytes_ = param_budget_bytes;
  default_chunk_size_ = chunk_size;
  HPS_LOG(INFO) << "Start to train: param budget " << param_budget_bytes_ / kMB
                << " MB, chunk size " << default_chunk_size_ << " elements";
}

void MemoryManager::update_margin_mem() {
  const auto& sys = gpu_trace_.sys_used;
  if (sys.empty()) {
    throw core::incomplete_trace(0, 0, "MemoryManager::update_margin_mem");
  }
  if (default_chunk_size_ == 0) {
    throw std::logic_error("MemoryManager::update_margin_mem called before start_train");
  }
  const std::int64_t max_sys = *std::max_element(sys.begin(), sys.end());
  const std::int64_t margin = as_i64(overall_gpu_mem_) - max_sys - as_i64(param_budget_bytes_);
  const double per_chunk = static_cast<double>(as_i64(default_chunk_size_) * kOptimizerStateBytesPerElement);
  const double num = static_cast<double>(margin) / per_chunk * cfg_.margin_use_ratio;
  margin_chunk_num_for_adam_ = num > 0 ? static_cast<std::int64_t>(std::floor(num)) : 0;

  HPS_LOG(INFO) << "--------------- GPU INFO AFTER BWD ----------------";
  HPS_LOG(INFO) << "Max GPU System Mem (non-chunk) Used " << max_sys / kMB << " MB";
  HPS_LOG(INFO) << "Param Chunk Budget " << param_budget_bytes_ / kMB << " MB";
  HPS_LOG(INFO) << "Margin Mem Size " << margin / kMB
                << " MB, available chunk num for Optimizer States " << margin_chunk_num_for_adam_;
}

void MemoryManager::reset_memory_stats() {
  gpu_trace_.clear();
  cpu_trace_.clear();
  HPS_LOG(INFO) << "Reset Memory Statistics";
}

std::int64_t MemoryManager::sys_used_at(std::size_t moment) const {
  const auto& sys = gpu_trace_.sys_used;
  if (moment >= sys.size()) {
    throw core::incomplete_trace(sys.size(), moment, "MemoryManager: moment outside recorded trace");
  }
  return sys[moment];
}

void MemoryManager::tiktac(TiktacContext& ctx) {
  Metronome& metronome = ctx.metronome();
  const core::Device& acc = ctx.accelerator();

  if (metronome.is_warmup()) {
    // One sample per moment, appended in order.
    if (gpu_trace_.sys_used.size() != metronome.moment()) {
      throw core::incomplete_trace(gpu_trace_.sys_used.size(), metronome.moment(),
                                   "MemoryManager::tiktac(warmup)");
    }
    const std::int64_t gpu_used = as_i64(info_->used_bytes(acc));
    const std::int64_t gpu_chunk = as_i64(gpu_chunk_used_mem_);
    gpu_trace_.used.push_back(gpu_used);
    gpu_trace_.chunk_used.push_back(gpu_chunk);
    gpu_trace_.sys_used.push_back(std::max<std::int64_t>(0, gpu_used - gpu_chunk));

    const std::int64_t cpu_used = as_i64(info_->used_bytes(core::Device::cpu()));
    const std::int64_t cpu_chunk = as_i64(cpu_chunk_used_mem_);
    cpu_trace_.used.push_back(cpu_used);
    cpu_trace_.chunk_used.push_back(cpu_chunk);
    cpu_trace_.sys_used.push_back(std::max<std::int64_t>(0, cpu_used - cpu_chunk));
  } else {
    const std::size_t cur = metronome.moment();
    const std::size_t next = metronome.next_moment();
    (void)sys_used_at(cur);
    const std::int64_t next_available = as_i64(overall_gpu_mem_) - sys_used_at(next);
    const std::int64_t resident = as_i64(ctx.chunk_list().get_chunk_memory_used(acc));
    if (next_available < resident) {
      const auto deficit = static_cast<std::size_t>(resident - next_available);
      HPS_DLOG(INFO) << "moment " << cur << ": look-ahead eviction of " << deficit
                     << " bytes before moment " << next;
      std::vector<chunk::ChunkId> victims = ctx.chunk_list().make_room(deficit, acc);
      ctx.evict(victims, acc);
    }
  }
  metronome.tiktac();
}

void MemoryManager::add(const core::Device& device, std::size_t nbytes) {
  if (core::device_class(device) == core::DeviceClass::Cpu) cpu_chunk_used_mem_ += nbytes;
  else gpu_chunk_used_mem_ += nbytes;
}

void MemoryManager::remove(const core::Device& device, std::size_t nbytes) {
  std::size_t& used = core::device_class(device) == core::DeviceClass::Cpu
      ? cpu_chunk_used_mem_ : gpu_chunk_used_mem_;
  if (used < nbytes) {
    throw std::logic_error("MemoryManager::remove: releasing " + std::to_string(nbytes) +
                           " bytes from " + device.to_string() + " with only " +
                           std::to_string(used) + " tracked");
  }
  used -= nbytes;
}

std::size_t MemoryManager::used_chunk_mem(const core::Device& device) const {
  return core::device_class(device) == core::DeviceClass::Cpu ? cpu_chunk_used_mem_ : gpu_chunk_used_mem_;
}

std::size_t MemoryManager::max_mem(const core::Device& device) const {
  return core::device_class(device) == core::DeviceClass::Cpu ? overall_cpu_mem_ : overall_gpu_mem_;
}

std::int64_t MemoryManager::available_chunk_mem(const Metronome& metronome,
                                                const core::Device& device) const {
  if (core::device_class(device) == core::DeviceClass::Cpu) {
    return as_i64(overall_cpu_mem_);
  }
  const std::int64_t overall = as_i64(overall_gpu_mem_);
  const auto warmup_share = static_cast<std::int64_t>(
      static_cast<double>(overall_gpu_mem_) * cfg_.warmup_gpu_chunk_mem_ratio);
  // Activation and workspace usage are unknown until warmup has run.
  if (cfg_.always_warmup || metronome.is_warmup() || !start_training_) {
    return warmup_share;
  }
  const std::int64_t chunk = as_i64(default_chunk_size_);
  switch (stage_) {
    case TrainingStage::Adam:
      // No activations compete with chunks while the optimizer runs.
      return overall - kAdamScratchBytesPerElement * chunk;
    case TrainingStage::Fwd:
    case TrainingStage::Bwd: {
      const std::int64_t cur_available = overall - sys_used_at(metronome.moment());
      const std::int64_t next_available = overall - sys_used_at(metronome.next_moment());
      return std::min(cur_available, next_available) -
             static_cast<std::int64_t>(cfg_.world_size) * kCommBufferBytesPerElement * chunk;
    }
    case TrainingStage::Unstart:
    case TrainingStage::Warmup:
      break;
  }
  return warmup_share;
}

std::int64_t MemoryManager::free_chunk_mem(const Metronome& metronome,
                                           const core::Device& device) const {
  const std::int64_t size = available_chunk_mem(metronome, device) - as_i64(used_chunk_mem(device));
  HPS_DLOG(INFO) << "free_chunk_mem on " << device.to_string() << " " << size / kMB
                 << " MB at moment " << metronome.moment();
  return size;
}

} // namespace manager
} // namespace hps
