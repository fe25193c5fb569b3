// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "hps/chunk/chunk.h"
#include "hps/chunk/tensor_record.h"
#include "hps/core/device.h"
#include "hps/core/dtype.h"
#include "hps/memory/backend.h"

namespace hps {
namespace chunk {

// Append-only sequence of chunks. Chunk ids equal their position and are
// never reused; chunks live until the list is destroyed.
class ChunkList {
 public:
  struct Allocation {
    ChunkId chunk_id{kInvalidChunkId};
    std::size_t offset{0};
    bool new_chunk{false};
  };

  ChunkList(std::size_t default_chunk_size, core::ScalarType dtype,
            const core::Device& default_device, memory::MemoryBackend& backend);

  ChunkList(const ChunkList&) = delete;
  ChunkList& operator=(const ChunkList&) = delete;

  // Places `numel` elements for tensor_id in the first chunk with room,
  // creating a chunk of max(default_chunk_size, numel) on the default device
  // when none qualifies. Throws std::invalid_argument on a duplicate id.
  Allocation allocate(std::size_t numel, TensorId tensor_id);
  // Gives back the extent of tensor_id when it is the newest record of its
  // chunk. The chunk itself stays in the list.
  bool pop(TensorId tensor_id) noexcept;

  // Chunk that allocate() would use without creating a new one.
  std::optional<ChunkId> find_fit(std::size_t numel) const noexcept;
  std::size_t new_chunk_capacity(std::size_t numel) const noexcept {
    return numel > default_chunk_size_ ? numel : default_chunk_size_;
  }

  // Selects non-COMPUTE chunks resident on `device`, least recently touched
  // first, until their bytes cover need_bytes. Does not move anything.
  // Throws HpsError(CapacityExceeded) when the candidates fall short.
  std::vector<ChunkId> make_room(std::size_t need_bytes, const core::Device& device) const;

  // Sum of payload bytes of chunks resident on `device`.
  std::size_t get_chunk_memory_used(const core::Device& device) const;

  void touch(ChunkId id);

  Chunk& at(ChunkId id);
  const Chunk& at(ChunkId id) const;
  Chunk& operator[](ChunkId id) { return at(id); }
  const Chunk& operator[](ChunkId id) const { return at(id); }

  std::optional<ChunkId> chunk_of(TensorId tensor_id) const noexcept;

  std::size_t size() const noexcept { return chunks_.size(); }
  const std::vector<std::unique_ptr<Chunk>>& chunks() const noexcept { return chunks_; }

  std::size_t default_chunk_size() const noexcept { return default_chunk_size_; }
  core::ScalarType dtype() const noexcept { return dtype_; }
  const core::Device& default_device() const noexcept { return default_device_; }

 private:
  std::size_t default_chunk_size_;
  core::ScalarType dtype_;
  core::Device default_device_;
  memory::MemoryBackend* backend_;
  std::vector<std::unique_ptr<Chunk>> chunks_{};
  std::unordered_map<TensorId, ChunkId> tensor_to_chunk_{};
  std::uint64_t clock_{0};  // logical time for LRU ranking
};

} // namespace chunk
} // namespace hps
