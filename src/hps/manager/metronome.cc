// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "hps/manager/metronome.h"

namespace hps {
namespace manager {

std::size_t Metronome::next_moment() const noexcept {
  if (!total_moments_ || *total_moments_ == 0) return moment_ + 1;
  return (moment_ + 1) % *total_moments_;
}

void Metronome::reset() noexcept {
  if (!total_moments_) total_moments_ = moment_;
  moment_ = 0;
}

void Metronome::restart_warmup() noexcept {
  total_moments_.reset();
  warmup_ = true;
  moment_ = 0;
}

} // namespace manager
} // namespace hps
