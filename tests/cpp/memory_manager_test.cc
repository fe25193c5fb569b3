// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "hps/chunk/chunk_list.h"
#include "hps/core/error.h"
#include "hps/manager/memory_manager.h"
#include "hps/memory/backend.h"
#include "hps_test_support.h"

using hps::chunk::ChunkId;
using hps::chunk::ChunkList;
using hps::chunk::TensorStatus;
using hps::core::DeviceClass;
using hps::core::ErrorCode;
using hps::core::HpsError;
using hps::core::ScalarType;
using hps::manager::ManagerConfig;
using hps::manager::MemoryManager;
using hps::manager::TrainingStage;
using hps::memory::HostBackend;
using hps::testonly::FakeMemoryInfo;
using hps::testonly::RecordingContext;
using hps::testonly::budget_config;
using hps::testonly::kAcc;
using hps::testonly::kHost;

namespace {

// Runs one warmup iteration recording the given accelerator usage, then
// closes it so the manager forecasts from the trace.
void run_warmup(MemoryManager& mm, FakeMemoryInfo& info, RecordingContext& ctx,
                const std::vector<std::size_t>& acc_used) {
  for (std::size_t used : acc_used) {
    info.set_used(kAcc, used);
    mm.tiktac(ctx);
  }
  ctx.metronome().reset();
  ctx.metronome().set_warmup(false);
}

} // namespace

TEST(MemoryManagerTest, BudgetsFromCapacityAndRatios) {
  FakeMemoryInfo info(200, 400);
  MemoryManager from_capacity(ManagerConfig{}, info);
  EXPECT_EQ(from_capacity.max_mem(kAcc), 160u);
  EXPECT_EQ(from_capacity.max_mem(kHost), 320u);

  ManagerConfig cfg = budget_config(100, 1000);
  cfg.world_size = 2;
  MemoryManager split(cfg, info);
  EXPECT_EQ(split.max_mem(kAcc), 100u);
  EXPECT_EQ(split.max_mem(kHost), 500u);

  cfg.use_fake_dist = true;
  MemoryManager fake(cfg, info);
  EXPECT_EQ(fake.max_mem(kAcc), 50u);
  EXPECT_EQ(fake.max_mem(kHost), 500u);
}

TEST(MemoryManagerTest, OccupancyBookkeeping) {
  FakeMemoryInfo info(100, 100);
  MemoryManager mm(budget_config(100, 100), info);
  mm.add(kAcc, 30);
  mm.add(kHost, 5);
  EXPECT_EQ(mm.used_chunk_mem(kAcc), 30u);
  EXPECT_EQ(mm.used_chunk_mem(hps::core::Device::cuda(1)), 30u);
  mm.remove(kAcc, 10);
  EXPECT_EQ(mm.used_chunk_mem(kAcc), 20u);
  EXPECT_THROW(mm.remove(kHost, 6), std::logic_error);
  EXPECT_EQ(mm.used_chunk_mem(kHost), 5u);
}

TEST(MemoryManagerTest, WarmupShareUntilTraceIsComplete) {
  FakeMemoryInfo info(100, 1000);
  MemoryManager mm(budget_config(100, 1000, 0.25), info);
  HostBackend be;
  ChunkList list(2, ScalarType::Bool, kAcc, be);
  RecordingContext ctx(list);

  EXPECT_EQ(mm.available_chunk_mem(ctx.metronome(), kAcc), 25);
  EXPECT_EQ(mm.available_chunk_mem(ctx.metronome(), kHost), 1000);

  mm.start_train(ctx.metronome(), 0, 2);
  mm.set_training_stage(TrainingStage::Adam);
  // warmup wins over the stage
  EXPECT_EQ(mm.available_chunk_mem(ctx.metronome(), kAcc), 25);

  mm.add(kAcc, 10);
  EXPECT_EQ(mm.free_chunk_mem(ctx.metronome(), kAcc), 15);
}

TEST(MemoryManagerTest, ForwardForecastUsesCurrentAndNextMoment) {
  FakeMemoryInfo info(100, 1000);
  MemoryManager mm(budget_config(100, 1000), info);
  HostBackend be;
  ChunkList list(2, ScalarType::Bool, kAcc, be);
  RecordingContext ctx(list);

  mm.start_train(ctx.metronome(), 0, 2);
  run_warmup(mm, info, ctx, {10, 20, 15});
  EXPECT_EQ(mm.trace(DeviceClass::Accelerator).sys_used, (std::vector<std::int64_t>{10, 20, 15}));

  mm.set_training_stage(TrainingStage::Fwd);
  // communication margin: world_size * 2 bytes * chunk_size
  const std::int64_t margin = 1 * 2 * 2;
  EXPECT_EQ(mm.available_chunk_mem(ctx.metronome(), kAcc), 80 - margin);
  ctx.metronome().tiktac();
  EXPECT_EQ(mm.available_chunk_mem(ctx.metronome(), kAcc), 80 - margin);
  ctx.metronome().tiktac();
  // moment 2 looks ahead to moment 0 of the next iteration
  EXPECT_EQ(mm.available_chunk_mem(ctx.metronome(), kAcc), 85 - margin);

  mm.set_training_stage(TrainingStage::Bwd);
  EXPECT_EQ(mm.available_chunk_mem(ctx.metronome(), kAcc), 85 - margin);

  mm.set_training_stage(TrainingStage::Adam);
  EXPECT_EQ(mm.available_chunk_mem(ctx.metronome(), kAcc), 100 - 16 * 2);
}

TEST(MemoryManagerTest, AlwaysWarmupKeepsWarmupShare) {
  FakeMemoryInfo info(100, 1000);
  ManagerConfig cfg = budget_config(100, 1000, 0.5);
  cfg.always_warmup = true;
  MemoryManager mm(cfg, info);
  HostBackend be;
  ChunkList list(2, ScalarType::Bool, kAcc, be);
  RecordingContext ctx(list);

  mm.start_train(ctx.metronome(), 0, 2);
  run_warmup(mm, info, ctx, {10, 20});
  mm.set_training_stage(TrainingStage::Fwd);
  EXPECT_EQ(mm.available_chunk_mem(ctx.metronome(), kAcc), 50);
}

TEST(MemoryManagerTest, WarmupSamplesExcludeChunkPayload) {
  FakeMemoryInfo info(100, 1000);
  MemoryManager mm(budget_config(100, 1000), info);
  HostBackend be;
  ChunkList list(2, ScalarType::Bool, kAcc, be);
  RecordingContext ctx(list);

  mm.start_train(ctx.metronome(), 0, 2);
  mm.add(kAcc, 30);
  info.set_used(kAcc, 50);
  info.set_used(kHost, 7);
  mm.tiktac(ctx);

  const auto& acc = mm.trace(DeviceClass::Accelerator);
  EXPECT_EQ(acc.used, (std::vector<std::int64_t>{50}));
  EXPECT_EQ(acc.chunk_used, (std::vector<std::int64_t>{30}));
  EXPECT_EQ(acc.sys_used, (std::vector<std::int64_t>{20}));
  EXPECT_EQ(mm.trace(DeviceClass::Cpu).sys_used, (std::vector<std::int64_t>{7}));
  EXPECT_EQ(ctx.metronome().moment(), 1u);
}

TEST(MemoryManagerTest, AbortedWarmupIsDiscarded) {
  FakeMemoryInfo info(100, 1000);
  MemoryManager mm(budget_config(100, 1000), info);
  HostBackend be;
  ChunkList list(2, ScalarType::Bool, kAcc, be);
  RecordingContext ctx(list);

  mm.start_train(ctx.metronome(), 0, 2);
  info.set_used(kAcc, 10);
  mm.tiktac(ctx);
  info.set_used(kAcc, 20);
  mm.tiktac(ctx);

  mm.reset_memory_stats();
  for (auto c : {DeviceClass::Accelerator, DeviceClass::Cpu}) {
    EXPECT_TRUE(mm.trace(c).used.empty());
    EXPECT_TRUE(mm.trace(c).chunk_used.empty());
    EXPECT_TRUE(mm.trace(c).sys_used.empty());
  }

  ctx.metronome().rewind();
  for (std::size_t used : {30u, 40u, 50u}) {
    info.set_used(kAcc, used);
    mm.tiktac(ctx);
  }
  EXPECT_EQ(mm.trace(DeviceClass::Accelerator).sys_used, (std::vector<std::int64_t>{30, 40, 50}));
}

TEST(MemoryManagerTest, WarmupSampleOutOfStepIsIncompleteTrace) {
  FakeMemoryInfo info(100, 1000);
  MemoryManager mm(budget_config(100, 1000), info);
  HostBackend be;
  ChunkList list(2, ScalarType::Bool, kAcc, be);
  RecordingContext ctx(list);

  mm.start_train(ctx.metronome(), 0, 2);
  mm.tiktac(ctx);
  mm.tiktac(ctx);
  mm.reset_memory_stats();
  // the metronome was not rewound, so the next sample would land at index 0
  // for moment 2
  try {
    mm.tiktac(ctx);
    FAIL() << "expected IncompleteTrace";
  } catch (const HpsError& e) {
    EXPECT_EQ(e.code(), ErrorCode::IncompleteTrace);
    EXPECT_FALSE(e.is_fatal());
  }
  // the rejected sample is not kept
  for (auto c : {DeviceClass::Accelerator, DeviceClass::Cpu}) {
    EXPECT_TRUE(mm.trace(c).used.empty());
    EXPECT_TRUE(mm.trace(c).chunk_used.empty());
    EXPECT_TRUE(mm.trace(c).sys_used.empty());
  }
  EXPECT_EQ(ctx.metronome().moment(), 2u);
}

TEST(MemoryManagerTest, ResetAfterWarmupDropsTrace) {
  FakeMemoryInfo info(100, 1000);
  MemoryManager mm(budget_config(100, 1000), info);
  HostBackend be;
  ChunkList list(2, ScalarType::Bool, kAcc, be);
  RecordingContext ctx(list);

  mm.start_train(ctx.metronome(), 0, 2);
  run_warmup(mm, info, ctx, {1, 2});
  ASSERT_EQ(mm.trace(DeviceClass::Accelerator).sys_used.size(), 2u);
  mm.reset_memory_stats();
  EXPECT_TRUE(mm.trace(DeviceClass::Accelerator).sys_used.empty());
  EXPECT_TRUE(mm.trace(DeviceClass::Cpu).sys_used.empty());

  mm.set_training_stage(TrainingStage::Fwd);
  try {
    (void)mm.available_chunk_mem(ctx.metronome(), kAcc);
    FAIL() << "expected IncompleteTrace";
  } catch (const HpsError& e) {
    EXPECT_EQ(e.code(), ErrorCode::IncompleteTrace);
  }
}

TEST(MemoryManagerTest, ForecastWithoutTraceIsIncompleteTrace) {
  FakeMemoryInfo info(100, 1000);
  MemoryManager mm(budget_config(100, 1000), info);
  HostBackend be;
  ChunkList list(2, ScalarType::Bool, kAcc, be);
  RecordingContext ctx(list);

  mm.start_train(ctx.metronome(), 0, 2);
  ctx.metronome().set_warmup(false);
  mm.set_training_stage(TrainingStage::Fwd);
  try {
    (void)mm.available_chunk_mem(ctx.metronome(), kAcc);
    FAIL() << "expected IncompleteTrace";
  } catch (const HpsError& e) {
    EXPECT_EQ(e.code(), ErrorCode::IncompleteTrace);
  }
  EXPECT_THROW(mm.update_margin_mem(), HpsError);
}

TEST(MemoryManagerTest, MarginChunksForOptimizer) {
  FakeMemoryInfo info(100, 1000);
  ManagerConfig cfg = budget_config(100, 1000);
  cfg.margin_use_ratio = 0.5;
  MemoryManager mm(cfg, info);
  HostBackend be;
  ChunkList list(2, ScalarType::Bool, kAcc, be);
  RecordingContext ctx(list);

  EXPECT_THROW(mm.start_train(ctx.metronome(), 20, 0), std::invalid_argument);
  mm.start_train(ctx.metronome(), 20, 2);
  run_warmup(mm, info, ctx, {10, 20, 15});
  // (100 - 20 - 20) / (2 * 12) * 0.5 = 1.25
  mm.update_margin_mem();
  EXPECT_EQ(mm.margin_chunk_num_for_adam(), 1);

  mm.start_train(ctx.metronome(), 200, 2);
  mm.update_margin_mem();
  EXPECT_EQ(mm.margin_chunk_num_for_adam(), 0);
}

TEST(MemoryManagerTest, LookAheadEvictsBeforeNextMoment) {
  FakeMemoryInfo info(100, 1000);
  MemoryManager mm(budget_config(100, 1000), info);
  HostBackend be;
  ChunkList list(10, ScalarType::Bool, kAcc, be);
  for (int i = 0; i < 3; ++i) {
    (void)list.allocate(10, i);
    list[i].set_tensor_status(i, TensorStatus::Hold);
  }
  RecordingContext ctx(list);

  mm.start_train(ctx.metronome(), 0, 10);
  run_warmup(mm, info, ctx, {10, 80, 15});

  // moment 1 leaves 20 bytes for 30 resident
  mm.tiktac(ctx);
  EXPECT_EQ(ctx.evicted, (std::vector<ChunkId>{0}));
  EXPECT_EQ(list[0].device(), kHost);
  EXPECT_EQ(list.get_chunk_memory_used(kAcc), 20u);

  mm.tiktac(ctx);
  mm.tiktac(ctx);
  EXPECT_EQ(ctx.evicted.size(), 1u);
  EXPECT_EQ(ctx.metronome().moment(), 3u);
}

TEST(MemoryManagerTest, LookAheadNeverEvictsComputeChunks) {
  FakeMemoryInfo info(100, 1000);
  MemoryManager mm(budget_config(100, 1000), info);
  HostBackend be;
  ChunkList list(10, ScalarType::Bool, kAcc, be);
  for (int i = 0; i < 3; ++i) {
    (void)list.allocate(10, i);
    list[i].set_tensor_status(i, TensorStatus::Hold);
  }
  RecordingContext ctx(list);

  mm.start_train(ctx.metronome(), 0, 10);
  run_warmup(mm, info, ctx, {10, 80, 15});

  list[0].set_tensor_status(0, TensorStatus::Compute);
  mm.tiktac(ctx);
  EXPECT_EQ(ctx.evicted, (std::vector<ChunkId>{1}));
  EXPECT_EQ(list[0].device(), kAcc);
}

TEST(SystemMemoryInfoTest, ReportsHostMemory) {
  hps::memory::SystemMemoryInfo info;
  EXPECT_GT(info.total_bytes(kHost), 0u);
  EXPECT_GT(info.used_bytes(kHost), 0u);
  EXPECT_LE(info.used_bytes(kHost), info.total_bytes(kHost));
#if !HPS_WITH_CUDA
  EXPECT_EQ(info.total_bytes(kAcc), 0u);
#endif
}
