// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <vector>

#include "hps/client/client.h"
#include "hps/core/error.h"
#include "hps/manager/memory_manager.h"
#include "hps/memory/backend.h"
#include "hps_test_support.h"

using hps::chunk::TensorStatus;
using hps::client::AccessType;
using hps::client::Client;
using hps::client::ClientOptions;
using hps::client::TensorHandle;
using hps::client::TensorSpec;
using hps::core::Device;
using hps::core::DeviceClass;
using hps::core::ErrorCode;
using hps::core::HpsError;
using hps::core::ScalarType;
using hps::manager::ManagerConfig;
using hps::manager::MemoryManager;
using hps::manager::TrainingStage;
using hps::memory::HostBackend;
using hps::testonly::FakeMemoryInfo;
using hps::testonly::budget_config;
using hps::testonly::kAcc;
using hps::testonly::kHost;

namespace {

ClientOptions byte_options(std::size_t chunk_size) {
  ClientOptions o;
  o.default_chunk_size = chunk_size;
  o.dtype = ScalarType::Bool;
  o.default_device = kHost;
  o.accelerator = kAcc;
  return o;
}

TensorSpec byte_spec(std::int64_t numel, const Device& compute, const void* data = nullptr,
                     const void* grad = nullptr) {
  TensorSpec s;
  s.shape = {numel};
  s.dtype = ScalarType::Bool;
  s.compute_device = compute;
  s.init_data = data;
  s.init_grad = grad;
  return s;
}

struct Harness {
  Harness(const ManagerConfig& cfg, std::size_t acc, std::size_t host, std::size_t chunk)
      : info(acc, host), mm(cfg, info), client(mm, be, byte_options(chunk)) {}
  Harness(std::size_t acc, std::size_t host, std::size_t chunk)
      : Harness(budget_config(acc, host), acc, host, chunk) {}

  // One moment of the training loop: access, sample, release. `sys` is the
  // non-chunk accelerator usage reported at this moment.
  void step(TensorHandle handle, std::size_t sys) {
    client.access_data(handle);
    info.set_used(kAcc, sys + mm.used_chunk_mem(kAcc));
    client.tiktac();
    client.release_data(handle);
  }

  FakeMemoryInfo info;
  MemoryManager mm;
  HostBackend be;
  Client client;
};

} // namespace

TEST(ClientEvictionTest, DeficitEvictsLeastRecentlyUsedChunk) {
  // 50 of the 100 accelerator bytes are taken; a 60 byte chunk is short by 10.
  Harness h(100, 1000, 50);
  h.client.register_tensor(1, byte_spec(25, kAcc));
  h.client.register_tensor(2, byte_spec(60, kAcc));

  h.client.access_data(1);
  h.client.release_data(1);
  ASSERT_EQ(h.mm.used_chunk_mem(kAcc), 50u);

  h.client.access_data(2);
  EXPECT_EQ(h.client.view(1, AccessType::Data).device, kHost);
  EXPECT_EQ(h.client.view(2, AccessType::Data).device, kAcc);
  EXPECT_EQ(h.client.record(2, AccessType::Data).status, TensorStatus::Compute);
  EXPECT_EQ(h.mm.used_chunk_mem(kAcc), 60u);
  EXPECT_EQ(h.mm.used_chunk_mem(kHost), 110u);
  EXPECT_EQ(h.client.chunk_list().get_chunk_memory_used(kAcc), 60u);
}

TEST(ClientEvictionTest, ComputeChunksAreNeverEvicted) {
  Harness h(100, 1000, 50);
  h.client.register_tensor(1, byte_spec(25, kAcc));
  h.client.register_tensor(2, byte_spec(60, kAcc));

  h.client.access_data(1);  // still COMPUTE
  try {
    h.client.access_data(2);
    FAIL() << "expected CapacityExceeded";
  } catch (const HpsError& e) {
    EXPECT_EQ(e.code(), ErrorCode::CapacityExceeded);
    EXPECT_EQ(e.requested_bytes(), 10u);
  }
  EXPECT_EQ(h.client.view(1, AccessType::Data).device, kAcc);
  EXPECT_EQ(h.client.view(2, AccessType::Data).device, kHost);
  EXPECT_EQ(h.client.record(2, AccessType::Data).status, TensorStatus::Hold);
  EXPECT_EQ(h.mm.used_chunk_mem(kAcc), 50u);
}

TEST(ClientEvictionTest, ChunkLargerThanDeviceBudgetFails) {
  Harness h(50, 1000, 50);
  h.client.register_tensor(2, byte_spec(60, kAcc));
  try {
    h.client.access_data(2);
    FAIL() << "expected CapacityExceeded";
  } catch (const HpsError& e) {
    EXPECT_EQ(e.code(), ErrorCode::CapacityExceeded);
    EXPECT_EQ(e.requested_bytes(), 60u);
    EXPECT_EQ(e.budget_bytes(), 50u);
    ASSERT_TRUE(e.device().has_value());
    EXPECT_EQ(*e.device(), kAcc);
  }
  EXPECT_EQ(h.mm.used_chunk_mem(kAcc), 0u);
}

TEST(ClientEvictionTest, DirectMoveRespectsTargetBudget) {
  Harness h(20, 1000, 32);
  h.client.register_tensor(1, byte_spec(16, kAcc));
  EXPECT_THROW(h.client.chunk_move(0, kAcc), HpsError);
  EXPECT_EQ(h.client.chunk_list()[0].device(), kHost);
  h.client.chunk_move(0, kHost);
  EXPECT_EQ(h.be.copy_count(), 0u);
}

TEST(ClientEvictionTest, PayloadSurvivesEvictionRoundTrip) {
  Harness h(120, 1000, 32);
  std::vector<unsigned char> data(16), grad(16);
  for (int i = 0; i < 16; ++i) {
    data[i] = static_cast<unsigned char>(i);
    grad[i] = static_cast<unsigned char>(200 - i);
  }
  h.client.register_tensor(1, byte_spec(16, kAcc, data.data(), grad.data()));
  h.client.register_tensor(2, byte_spec(100, kAcc));
  const auto data_id = h.client.tensor_id(1, AccessType::Data);
  const auto grad_id = h.client.tensor_id(1, AccessType::Grad);

  h.client.access_data(1);
  EXPECT_EQ(std::memcmp(h.client.view(1, AccessType::Data).data, data.data(), 16), 0);
  h.client.release_data(1);

  // 88 bytes free for a 100 byte chunk: chunk 0 goes back to the host
  h.client.access_data(2);
  h.client.release_data(2);
  EXPECT_EQ(h.client.view(1, AccessType::Data).device, kHost);
  EXPECT_EQ(std::memcmp(h.client.view(1, AccessType::Data).data, data.data(), 16), 0);
  EXPECT_EQ(std::memcmp(h.client.view(1, AccessType::Grad).data, grad.data(), 16), 0);

  h.client.access_grad(1);
  EXPECT_EQ(h.client.view(2, AccessType::Data).device, kHost);
  EXPECT_EQ(h.client.view(1, AccessType::Grad).device, kAcc);
  EXPECT_EQ(std::memcmp(h.client.view(1, AccessType::Grad).data, grad.data(), 16), 0);

  // identities and extents never change, views follow the chunk
  EXPECT_EQ(h.client.tensor_id(1, AccessType::Data), data_id);
  EXPECT_EQ(h.client.tensor_id(1, AccessType::Grad), grad_id);
  const auto& rec = h.client.record(1, AccessType::Grad);
  EXPECT_EQ(rec.offset, 16u);
  EXPECT_EQ(h.client.view(1, AccessType::Grad).data,
            h.client.chunk_list()[rec.chunk_id].tensor_data(rec));
}

TEST(ClientEvictionTest, LookAheadAndReactiveEvictionDoNotDoubleCount) {
  // 100 byte accelerator, four 10 byte chunks (one per handle), warmup share 50.
  Harness h(budget_config(100, 1000, 0.5), 100, 1000, 10);
  for (TensorHandle t = 0; t < 4; ++t) h.client.register_tensor(t, byte_spec(5, kAcc));

  h.client.start_train(0);
  h.client.set_training_stage(TrainingStage::Fwd);
  const std::vector<std::size_t> sys = {0, 0, 65, 0};
  for (TensorHandle t = 0; t < 4; ++t) h.step(t, sys[t]);
  h.client.end_iteration();
  ASSERT_FALSE(h.client.metronome().is_warmup());
  ASSERT_EQ(h.mm.used_chunk_mem(kAcc), 40u);
  ASSERT_EQ(h.be.copy_count(), 4u);

  h.step(0, sys[0]);
  // moment 2 leaves 35 bytes for 40 resident: the look-ahead evicts the
  // least recently used chunk (handle 2)
  h.step(1, sys[1]);
  EXPECT_EQ(h.client.view(2, AccessType::Data).device, kHost);
  EXPECT_EQ(h.mm.used_chunk_mem(kAcc), 30u);
  EXPECT_EQ(h.be.copy_count(), 5u);

  // The forecast at moment 2 is min(35, 100) - 20 = 15 bytes with 30 still
  // resident, so the 10 byte chunk needs exactly 25 more bytes evicted.
  h.client.access_data(2);
  EXPECT_EQ(h.client.view(2, AccessType::Data).device, kAcc);
  for (TensorHandle t : {0, 1, 3}) {
    EXPECT_EQ(h.client.view(t, AccessType::Data).device, kHost) << "handle " << t;
  }
  EXPECT_EQ(h.mm.used_chunk_mem(kAcc), 10u);
  EXPECT_EQ(h.client.chunk_list().get_chunk_memory_used(kAcc), 10u);
  EXPECT_LE(static_cast<std::int64_t>(h.mm.used_chunk_mem(kAcc)),
            h.mm.available_chunk_mem(h.client.metronome(), kAcc));
  EXPECT_EQ(h.be.copy_count(), 9u);

  h.info.set_used(kAcc, sys[2] + h.mm.used_chunk_mem(kAcc));
  h.client.tiktac();
  h.client.release_data(2);
  h.step(3, sys[3]);
  EXPECT_NO_THROW(h.client.end_iteration());
}

TEST(ClientEvictionTest, IterationShorterThanTraceIsIncompleteTrace) {
  Harness h(100, 1000, 16);
  h.client.register_tensor(1, byte_spec(8, kAcc));
  h.client.start_train(0);
  h.step(1, 0);
  h.step(1, 0);
  h.client.end_iteration();
  ASSERT_EQ(*h.client.metronome().total_moments(), 2u);

  h.step(1, 0);
  try {
    h.client.end_iteration();
    FAIL() << "expected IncompleteTrace";
  } catch (const HpsError& e) {
    EXPECT_EQ(e.code(), ErrorCode::IncompleteTrace);
    EXPECT_FALSE(e.is_fatal());
  }
}

TEST(ClientEvictionTest, ResetAfterShortIterationWarmsUpAgain) {
  Harness h(100, 1000, 16);
  h.client.register_tensor(1, byte_spec(8, kAcc));
  h.client.start_train(0);
  for (int i = 0; i < 3; ++i) h.step(1, 0);
  h.client.end_iteration();
  ASSERT_FALSE(h.client.metronome().is_warmup());

  h.step(1, 0);
  EXPECT_THROW(h.client.end_iteration(), HpsError);

  h.client.reset_memory_stats();
  EXPECT_EQ(h.client.metronome().moment(), 0u);
  EXPECT_TRUE(h.client.metronome().is_warmup());
  EXPECT_FALSE(h.client.metronome().total_moments().has_value());
  EXPECT_TRUE(h.mm.trace(DeviceClass::Accelerator).sys_used.empty());

  for (std::size_t s : {4u, 5u, 6u}) h.step(1, s);
  EXPECT_EQ(h.mm.trace(DeviceClass::Accelerator).sys_used, (std::vector<std::int64_t>{4, 5, 6}));
  EXPECT_NO_THROW(h.client.end_iteration());
  EXPECT_FALSE(h.client.metronome().is_warmup());
  EXPECT_EQ(*h.client.metronome().total_moments(), 3u);

  for (std::size_t s : {4u, 5u, 6u}) h.step(1, s);
  EXPECT_NO_THROW(h.client.end_iteration());
}

TEST(ClientEvictionTest, AbortedWarmupRestartsFromMomentZero) {
  Harness h(100, 1000, 16);
  h.client.register_tensor(1, byte_spec(8, kAcc));
  h.client.start_train(0);
  h.step(1, 10);
  h.step(1, 20);

  h.client.reset_memory_stats();
  EXPECT_EQ(h.client.metronome().moment(), 0u);
  EXPECT_TRUE(h.client.metronome().is_warmup());
  EXPECT_TRUE(h.mm.trace(DeviceClass::Accelerator).sys_used.empty());

  for (std::size_t s : {30u, 40u, 50u}) h.step(1, s);
  EXPECT_EQ(h.mm.trace(DeviceClass::Accelerator).sys_used, (std::vector<std::int64_t>{30, 40, 50}));
  h.client.end_iteration();
  EXPECT_EQ(*h.client.metronome().total_moments(), 3u);
}

TEST(ClientEvictionTest, AlwaysWarmupRecordsEveryIteration) {
  ManagerConfig cfg = budget_config(100, 1000);
  cfg.always_warmup = true;
  Harness h(cfg, 100, 1000, 16);
  h.client.register_tensor(1, byte_spec(8, kAcc));
  h.client.start_train(0);
  h.step(1, 5);
  h.step(1, 6);
  h.client.end_iteration();

  EXPECT_TRUE(h.client.metronome().is_warmup());
  EXPECT_EQ(h.client.metronome().moment(), 0u);
  EXPECT_TRUE(h.mm.trace(DeviceClass::Accelerator).sys_used.empty());
  h.step(1, 7);
  EXPECT_EQ(h.mm.trace(DeviceClass::Accelerator).sys_used, (std::vector<std::int64_t>{7}));
}
