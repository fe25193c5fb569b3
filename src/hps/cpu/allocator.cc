// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "hps/cpu/allocator.h"

#include <cstdlib>
#include <limits>
#include <new>

#include "hps/logging/logging.h"

namespace hps { namespace cpu {

static_assert((Allocator::kAlignment & (Allocator::kAlignment - 1)) == 0, "alignment must be a power of two");
static_assert(Allocator::kAlignment >= alignof(std::max_align_t), "alignment below max_align_t");

Allocator& Allocator::get() {
  static Allocator* inst = new Allocator();  // outlives static chunk owners
  return *inst;
}

void* Allocator::raw_alloc(std::size_t nbytes) {
  if (nbytes == 0) return nullptr;
  if (nbytes > std::numeric_limits<std::size_t>::max() - (kAlignment - 1)) throw std::bad_alloc();
  const std::size_t rounded = (nbytes + kAlignment - 1) / kAlignment * kAlignment;
  void* p = nullptr;
  if (posix_memalign(&p, kAlignment, rounded) != 0 || p == nullptr) {
    HPS_LOG(ERROR) << "host payload allocation of " << rounded << " bytes failed";
    throw std::bad_alloc();
  }
  std::lock_guard<std::mutex> lg(mu_);
  held_by_ptr_[p] = rounded;
  held_ += rounded;
  return p;
}

void Allocator::raw_delete(void* p) noexcept {
  if (!p) return;
  {
    std::lock_guard<std::mutex> lg(mu_);
    auto it = held_by_ptr_.find(p);
    if (it != held_by_ptr_.end()) {
      held_ -= it->second;
      held_by_ptr_.erase(it);
    }
  }
  std::free(p);
}

std::size_t Allocator::held_bytes() const {
  std::lock_guard<std::mutex> lg(mu_);
  return held_;
}

}} // namespace hps::cpu
