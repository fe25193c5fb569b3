// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "hps/chunk/chunk.h"

#include <stdexcept>
#include <string>
#include <utility>

#include "hps/core/error.h"
#include "hps/logging/logging.h"

namespace hps {
namespace chunk {

Chunk::Chunk(ChunkId id, std::size_t capacity, core::ScalarType dtype,
             const core::Device& device, memory::MemoryBackend& backend)
    : id_(id), capacity_(capacity), dtype_(dtype), device_(device), backend_(&backend) {
  if (capacity_ == 0) {
    throw std::invalid_argument("Chunk: capacity must be positive");
  }
  if (core::itemsize(dtype_) == 0) {
    throw std::invalid_argument(std::string("Chunk: unsupported dtype ") + core::to_string(dtype_));
  }
  (void)core::device_class(device_);
  data_ = backend_->allocate(device_, nbytes());
}

std::size_t Chunk::allocate(TensorId tensor_id, std::size_t numel) {
  if (numel > remaining()) {
    const std::size_t isz = core::itemsize(dtype_);
    throw core::capacity_exceeded(device_, numel * isz, remaining() * isz,
                                  "Chunk::allocate(chunk " + std::to_string(id_) + ")");
  }
  TensorRecord rec;
  rec.tensor_id = tensor_id;
  rec.chunk_id = id_;
  rec.offset = used_;
  rec.numel = numel;
  rec.status = TensorStatus::Uninit;
  tensors_.push_back(rec);
  used_ += numel;
  return rec.offset;
}

bool Chunk::pop(TensorId tensor_id) noexcept {
  if (tensors_.empty() || tensors_.back().tensor_id != tensor_id) return false;
  used_ -= tensors_.back().numel;
  tensors_.pop_back();
  return true;
}

void Chunk::move(const core::Device& target, const RebindFn& rebind) {
  if (target == device_) return;
  // Stage the new buffer completely before touching any state.
  core::DataPtr staged = backend_->allocate(target, nbytes());
  backend_->copy(staged.get(), target, data_.get(), device_, nbytes());

  HPS_DLOG(INFO) << "chunk " << id_ << " moved " << device_.to_string() << " -> " << target.to_string();
  data_.swap(staged);
  device_ = target;
  staged.reset();

  if (rebind) {
    for (const auto& rec : tensors_) rebind(rec, tensor_data(rec), device_);
  }
}

TensorStatus Chunk::status() const noexcept {
  bool hold = false;
  for (const auto& rec : tensors_) {
    if (rec.status == TensorStatus::Compute) return TensorStatus::Compute;
    if (rec.status == TensorStatus::Hold) hold = true;
  }
  return hold ? TensorStatus::Hold : TensorStatus::Free;
}

const TensorRecord* Chunk::find(TensorId tensor_id) const noexcept {
  for (const auto& rec : tensors_) {
    if (rec.tensor_id == tensor_id) return &rec;
  }
  return nullptr;
}

TensorRecord* Chunk::find(TensorId tensor_id) noexcept {
  for (auto& rec : tensors_) {
    if (rec.tensor_id == tensor_id) return &rec;
  }
  return nullptr;
}

void Chunk::set_tensor_status(TensorId tensor_id, TensorStatus status, std::int64_t moment) {
  TensorRecord* rec = find(tensor_id);
  if (rec == nullptr) {
    throw core::invalid_access(tensor_id, "Chunk::set_tensor_status(chunk " + std::to_string(id_) + ")");
  }
  rec->status = status;
  if (moment >= 0) rec->last_touched = moment;
}

void Chunk::reclaim() noexcept {
  for (auto& rec : tensors_) rec.status = TensorStatus::Free;
}

} // namespace chunk
} // namespace hps
