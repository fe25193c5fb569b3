// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "hps/chunk/tensor_record.h"
#include "hps/core/data_ptr.h"
#include "hps/core/device.h"
#include "hps/core/dtype.h"
#include "hps/memory/backend.h"

namespace hps {
namespace chunk {

// Fixed-capacity contiguous payload resident on exactly one device. Tensors
// are packed back to back in allocation order.
class Chunk {
 public:
  // Called once per member tensor after a successful move with the tensor's
  // new base address.
  using RebindFn = std::function<void(const TensorRecord&, void* data, const core::Device& device)>;

  Chunk(ChunkId id, std::size_t capacity, core::ScalarType dtype,
        const core::Device& device, memory::MemoryBackend& backend);

  Chunk(const Chunk&) = delete;
  Chunk& operator=(const Chunk&) = delete;

  ChunkId id() const noexcept { return id_; }
  std::size_t capacity() const noexcept { return capacity_; }
  core::ScalarType dtype() const noexcept { return dtype_; }
  std::size_t nbytes() const noexcept { return capacity_ * core::itemsize(dtype_); }
  const core::Device& device() const noexcept { return device_; }
  void* data() const noexcept { return data_.get(); }

  std::size_t used() const noexcept { return used_; }
  std::size_t remaining() const noexcept { return capacity_ - used_; }

  // Appends a record for tensor_id and returns its element offset.
  // Throws HpsError(CapacityExceeded) when remaining() < numel.
  std::size_t allocate(TensorId tensor_id, std::size_t numel);
  // Undoes the most recent allocate() if it was for tensor_id and returns
  // true; otherwise changes nothing and returns false.
  bool pop(TensorId tensor_id) noexcept;

  void touch(std::uint64_t stamp) noexcept { last_touch_ = stamp; }
  std::uint64_t last_touch() const noexcept { return last_touch_; }

  // Copies the whole payload to `target`, then rebinds every member view.
  // If allocation or copy throws the chunk is left untouched on its old device.
  void move(const core::Device& target, const RebindFn& rebind);

  // COMPUTE if any member is COMPUTE, else HOLD if any is HOLD, else FREE.
  TensorStatus status() const noexcept;

  const std::vector<TensorRecord>& tensors() const noexcept { return tensors_; }
  const TensorRecord* find(TensorId tensor_id) const noexcept;
  TensorRecord* find(TensorId tensor_id) noexcept;

  // Throws HpsError(InvalidAccess) when tensor_id is not a member.
  void set_tensor_status(TensorId tensor_id, TensorStatus status, std::int64_t moment = -1);

  // Marks every member FREE; payload and extents stay reserved.
  void reclaim() noexcept;

  void* tensor_data(const TensorRecord& rec) const noexcept {
    return static_cast<unsigned char*>(data_.get()) + rec.offset * core::itemsize(dtype_);
  }

 private:
  ChunkId id_;
  std::size_t capacity_;
  core::ScalarType dtype_;
  core::Device device_;
  memory::MemoryBackend* backend_;
  core::DataPtr data_{};
  std::size_t used_{0};
  std::uint64_t last_touch_{0};
  std::vector<TensorRecord> tensors_{};
};

} // namespace chunk
} // namespace hps
