// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <mutex>
#include <unordered_map>

namespace hps { namespace cpu {

// Process-wide source of host chunk payloads. Buffers are rounded up to
// kAlignment, and the allocator remembers how many bytes it currently holds
// so SystemMemoryInfo can count payload pages the OS has not faulted in.
class Allocator final {
 public:
  static constexpr std::size_t kAlignment = 64;

  static Allocator& get();

  // nullptr for nbytes == 0; throws std::bad_alloc when the OS refuses.
  void* raw_alloc(std::size_t nbytes);
  void  raw_delete(void* p) noexcept;

  // Rounded bytes of every live payload.
  std::size_t held_bytes() const;

 private:
  Allocator() = default;

  mutable std::mutex mu_{};
  std::size_t held_{0};
  std::unordered_map<void*, std::size_t> held_by_ptr_{};
};

}} // namespace hps::cpu
