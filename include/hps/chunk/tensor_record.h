// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

namespace hps {
namespace chunk {

using TensorId = std::int64_t;
using ChunkId = std::int64_t;

inline constexpr ChunkId kInvalidChunkId = -1;

// UNINIT -> HOLD once the payload is populated; HOLD <-> COMPUTE through
// access/release. FREE only when a chunk's contents are reclaimed.
enum class TensorStatus : std::uint8_t {
  Uninit = 0,
  Hold = 1,
  Compute = 2,
  Free = 3,
};

inline constexpr const char* to_string(TensorStatus s) noexcept {
  switch (s) {
    case TensorStatus::Uninit: return "UNINIT";
    case TensorStatus::Hold: return "HOLD";
    case TensorStatus::Compute: return "COMPUTE";
    case TensorStatus::Free: return "FREE";
  }
  return "UNKNOWN";
}

struct TensorRecord {
  TensorId tensor_id{-1};
  ChunkId chunk_id{kInvalidChunkId};
  std::size_t offset{0};  // in elements
  std::size_t numel{0};
  TensorStatus status{TensorStatus::Uninit};
  std::int64_t last_touched{-1};  // metronome moment of the last access
};

} // namespace chunk
} // namespace hps
