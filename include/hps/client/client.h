// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <dlpack/dlpack.h>

#include "hps/chunk/chunk_list.h"
#include "hps/chunk/tensor_record.h"
#include "hps/client/topology.h"
#include "hps/core/device.h"
#include "hps/core/dtype.h"
#include "hps/manager/config.h"
#include "hps/manager/memory_manager.h"
#include "hps/manager/metronome.h"
#include "hps/memory/backend.h"

namespace hps {
namespace client {

// Opaque identity of an external tensor (a model parameter). The client never
// looks inside it.
using TensorHandle = std::uint64_t;

enum class AccessType : std::uint8_t {
  Data = 0,
  Grad = 1,
};

inline constexpr const char* to_string(AccessType t) noexcept {
  return t == AccessType::Data ? "data" : "grad";
}

// What the model provider hands over at registration.
struct TensorSpec {
  std::vector<std::int64_t> shape{};
  core::ScalarType dtype{core::ScalarType::Float32};
  core::Device compute_device{core::Device::cpu()};
  // Optional host-resident initial payloads, numel() elements each.
  const void* init_data{nullptr};
  const void* init_grad{nullptr};
};

// External view of one payload. Rebound whenever its chunk moves.
struct TensorView {
  void* data{nullptr};
  core::Device device{};
  std::vector<std::int64_t> shape{};
  core::ScalarType dtype{core::ScalarType::Float32};

  std::size_t numel() const noexcept;
  std::size_t nbytes() const noexcept { return numel() * core::itemsize(dtype); }
  // Non-owning; valid until the next move of the backing chunk.
  DLTensor to_dltensor() const noexcept;
};

struct ClientOptions {
  std::size_t default_chunk_size{1 << 20};  // elements
  core::ScalarType dtype{core::ScalarType::Float32};
  core::Device default_device{core::Device::cpu()};
  core::Device accelerator{core::Device::cuda(0)};
};

// Binds external tensors to chunks and runs the access/release protocol.
// Single-threaded: one client per process, driven by the training loop.
class Client final : public manager::TiktacContext {
 public:
  Client(manager::MemoryManager& manager, memory::MemoryBackend& backend, const ClientOptions& opts);
  Client(manager::MemoryManager& manager, memory::MemoryBackend& backend, const ClientOptions& opts,
         DeviceTopology topology);

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  // Allocates data and grad payloads for `handle`. Registering an already
  // registered handle is a no-op.
  void register_tensor(TensorHandle handle, const TensorSpec& spec);
  void register_tensors(const std::vector<std::pair<TensorHandle, TensorSpec>>& tensors);
  bool is_registered(TensorHandle handle) const noexcept;

  // Reserves `numel` elements for tensor_id, making room on the default
  // device first when a new chunk is needed.
  chunk::ChunkList::Allocation new_tensor(std::size_t numel, chunk::TensorId tensor_id);

  // Makes the payload resident on its compute device and marks it COMPUTE.
  // Throws HpsError(InvalidAccess) for unregistered handles and
  // HpsError(CapacityExceeded) when the device cannot make room.
  void access(TensorHandle handle, AccessType kind);
  void access_data(TensorHandle handle) { access(handle, AccessType::Data); }
  void access_grad(TensorHandle handle) { access(handle, AccessType::Grad); }

  // Marks the payload HOLD; nothing is freed or moved.
  void release(TensorHandle handle, AccessType kind);
  void release_data(TensorHandle handle) { release(handle, AccessType::Data); }
  void release_grad(TensorHandle handle) { release(handle, AccessType::Grad); }

  const TensorView& view(TensorHandle handle, AccessType kind) const;
  chunk::TensorId tensor_id(TensorHandle handle, AccessType kind) const;
  const chunk::TensorRecord& record(TensorHandle handle, AccessType kind) const;

  // Ensures `device` can take need_bytes more chunk payload, evicting
  // least recently used chunks along the topology if necessary.
  void prepare_device(const core::Device& device, std::size_t need_bytes);
  void chunk_move(chunk::ChunkId chunk_id, const core::Device& device);

  // Training-loop entry points.
  void start_train(std::size_t param_budget_bytes);
  void set_training_stage(manager::TrainingStage stage) { manager_->set_training_stage(stage); }
  void tiktac() { manager_->tiktac(*this); }
  // Closes an iteration. Ends warmup after the first complete one, or drops
  // the trace again when every iteration is a warmup.
  void end_iteration();
  // Discards the recorded trace and restarts the iteration at moment 0.
  // Called after warmup it starts a new warmup, which is how a loop recovers
  // from IncompleteTrace.
  void reset_memory_stats();

  // Collective pass-through. The hook sees the operand where it lives now.
  using CollectiveHook = std::function<void(const TensorView&)>;
  void allreduce(TensorHandle handle, AccessType kind, const CollectiveHook& hook);
  void broadcast(TensorHandle handle, AccessType kind, const CollectiveHook& hook);
  const core::Device& operand_device(TensorHandle handle, AccessType kind) const {
    return view(handle, kind).device;
  }

  // Logs every chunk with its device, status and members.
  void visit() const;

  // TiktacContext
  manager::Metronome& metronome() override { return metronome_; }
  const chunk::ChunkList& chunk_list() const override { return chunk_list_; }
  const core::Device& accelerator() const override { return opts_.accelerator; }
  void evict(const std::vector<chunk::ChunkId>& victims, const core::Device& from) override;

  const manager::Metronome& metronome() const noexcept { return metronome_; }
  manager::MemoryManager& memory_manager() noexcept { return *manager_; }
  const DeviceTopology& topology() const noexcept { return topology_; }
  const ClientOptions& options() const noexcept { return opts_; }

 private:
  struct Binding {
    chunk::TensorId id{-1};
    TensorView view{};
  };
  struct Entry {
    core::Device compute_device{};
    Binding data{};
    Binding grad{};

    Binding& get(AccessType kind) { return kind == AccessType::Data ? data : grad; }
    const Binding& get(AccessType kind) const { return kind == AccessType::Data ? data : grad; }
  };
  struct Owner {
    TensorHandle handle{0};
    AccessType kind{AccessType::Data};
  };

  Entry& entry_or_throw(TensorHandle handle, const char* what);
  const Entry& entry_or_throw(TensorHandle handle, const char* what) const;
  chunk::TensorId generate_id();
  void bind(TensorHandle handle, AccessType kind, Binding& b,
            const std::vector<std::int64_t>& shape, const void* init);

  manager::MemoryManager* manager_;
  memory::MemoryBackend* backend_;
  ClientOptions opts_;
  DeviceTopology topology_;
  manager::Metronome metronome_{};
  chunk::ChunkList chunk_list_;

  std::unordered_map<TensorHandle, Entry> entries_{};
  std::unordered_map<chunk::TensorId, Owner> owners_{};
  chunk::TensorId next_id_{0};
};

} // namespace client
} // namespace hps
