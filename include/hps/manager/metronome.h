// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <optional>

namespace hps {
namespace manager {

// Counts tensor-access points ("moments") within one training iteration.
// The access pattern repeats every iteration, so moment i of any iteration
// lines up with sample i recorded during warmup.
class Metronome {
 public:
  std::size_t moment() const noexcept { return moment_; }

  // Index that follows the current one. Wraps to 0 once the iteration length
  // is known; during the first iteration it is simply moment() + 1.
  std::size_t next_moment() const noexcept;

  void tiktac() noexcept { ++moment_; }

  bool is_warmup() const noexcept { return warmup_; }
  void set_warmup(bool flag) noexcept { warmup_ = flag; }

  // End of iteration: the first completed iteration fixes the length.
  void reset() noexcept;
  // Back to moment 0 without recording a length (aborted iteration).
  void rewind() noexcept { moment_ = 0; }
  // Forgets the iteration length and starts a new warmup at moment 0.
  void restart_warmup() noexcept;

  const std::optional<std::size_t>& total_moments() const noexcept { return total_moments_; }

 private:
  std::size_t moment_{0};
  std::optional<std::size_t> total_moments_{};
  bool warmup_{false};
};

} // namespace manager
} // namespace hps
