// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <optional>
#include <absl/log/check.h>
#include <absl/log/log.h>

namespace hps {
// Initialize Abseil logging once; optionally set min log level.
void InitLogging(std::optional<int> min_level);
}

#define HPS_LOG(level) LOG(level)
#define HPS_DLOG(level) DLOG(level)
#define HPS_CHECK(cond) CHECK(cond)
