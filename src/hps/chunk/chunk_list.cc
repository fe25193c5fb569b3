// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "hps/chunk/chunk_list.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "hps/core/error.h"
#include "hps/logging/logging.h"

namespace hps {
namespace chunk {

ChunkList::ChunkList(std::size_t default_chunk_size, core::ScalarType dtype,
                     const core::Device& default_device, memory::MemoryBackend& backend)
    : default_chunk_size_(default_chunk_size),
      dtype_(dtype),
      default_device_(default_device),
      backend_(&backend) {
  if (default_chunk_size_ == 0) {
    throw std::invalid_argument("ChunkList: default_chunk_size must be positive");
  }
  (void)core::device_class(default_device_);
}

std::optional<ChunkId> ChunkList::find_fit(std::size_t numel) const noexcept {
  if (chunks_.empty()) return std::nullopt;
  // Most allocations land in the newest chunk.
  if (chunks_.back()->remaining() >= numel) return chunks_.back()->id();
  for (const auto& c : chunks_) {
    if (c->remaining() >= numel) return c->id();
  }
  return std::nullopt;
}

ChunkList::Allocation ChunkList::allocate(std::size_t numel, TensorId tensor_id) {
  if (tensor_to_chunk_.count(tensor_id) != 0) {
    throw std::invalid_argument("ChunkList::allocate: tensor " + std::to_string(tensor_id) +
                                " already has a chunk");
  }
  Allocation out;
  if (auto fit = find_fit(numel)) {
    out.chunk_id = *fit;
  } else {
    const ChunkId id = static_cast<ChunkId>(chunks_.size());
    const std::size_t cap = new_chunk_capacity(numel);
    chunks_.push_back(std::make_unique<Chunk>(id, cap, dtype_, default_device_, *backend_));
    out.chunk_id = id;
    out.new_chunk = true;
    HPS_DLOG(INFO) << "chunk " << id << " created with capacity " << cap
                   << " on " << default_device_.to_string();
  }
  out.offset = chunks_[static_cast<std::size_t>(out.chunk_id)]->allocate(tensor_id, numel);
  tensor_to_chunk_.emplace(tensor_id, out.chunk_id);
  return out;
}

bool ChunkList::pop(TensorId tensor_id) noexcept {
  auto it = tensor_to_chunk_.find(tensor_id);
  if (it == tensor_to_chunk_.end()) return false;
  if (!chunks_[static_cast<std::size_t>(it->second)]->pop(tensor_id)) return false;
  tensor_to_chunk_.erase(it);
  return true;
}

std::vector<ChunkId> ChunkList::make_room(std::size_t need_bytes, const core::Device& device) const {
  (void)core::device_class(device);
  std::vector<ChunkId> victims;
  if (need_bytes == 0) return victims;

  std::vector<const Chunk*> candidates;
  std::size_t resident_bytes = 0;
  for (const auto& c : chunks_) {
    if (c->device() != device) continue;
    resident_bytes += c->nbytes();
    if (c->status() == TensorStatus::Compute) continue;
    candidates.push_back(c.get());
  }
  std::sort(candidates.begin(), candidates.end(), [](const Chunk* a, const Chunk* b) {
    if (a->last_touch() != b->last_touch()) return a->last_touch() < b->last_touch();
    return a->id() < b->id();
  });

  std::size_t freed = 0;
  for (const Chunk* c : candidates) {
    if (freed >= need_bytes) break;
    victims.push_back(c->id());
    freed += c->nbytes();
  }
  if (freed < need_bytes) {
    throw core::capacity_exceeded(device, need_bytes, freed,
                                  "ChunkList::make_room (" + std::to_string(resident_bytes) +
                                      " bytes resident, evictable " + std::to_string(freed) + ")");
  }
  HPS_DLOG(INFO) << "make_room " << need_bytes << " bytes on " << device.to_string()
                 << ": " << victims.size() << " victim chunk(s), " << freed << " bytes";
  return victims;
}

std::size_t ChunkList::get_chunk_memory_used(const core::Device& device) const {
  std::size_t total = 0;
  for (const auto& c : chunks_) {
    if (c->device() == device) total += c->nbytes();
  }
  return total;
}

void ChunkList::touch(ChunkId id) {
  at(id).touch(++clock_);
}

Chunk& ChunkList::at(ChunkId id) {
  if (id < 0 || static_cast<std::size_t>(id) >= chunks_.size()) {
    throw std::out_of_range("ChunkList: chunk id " + std::to_string(id) + " out of range");
  }
  return *chunks_[static_cast<std::size_t>(id)];
}

const Chunk& ChunkList::at(ChunkId id) const {
  if (id < 0 || static_cast<std::size_t>(id) >= chunks_.size()) {
    throw std::out_of_range("ChunkList: chunk id " + std::to_string(id) + " out of range");
  }
  return *chunks_[static_cast<std::size_t>(id)];
}

std::optional<ChunkId> ChunkList::chunk_of(TensorId tensor_id) const noexcept {
  auto it = tensor_to_chunk_.find(tensor_id);
  if (it == tensor_to_chunk_.end()) return std::nullopt;
  return it->second;
}

} // namespace chunk
} // namespace hps
