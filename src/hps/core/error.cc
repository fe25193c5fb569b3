// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "hps/core/error.h"

namespace hps {
namespace core {

const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::CapacityExceeded: return "CapacityExceeded";
    case ErrorCode::InvalidAccess: return "InvalidAccess";
    case ErrorCode::UnsupportedDevice: return "UnsupportedDevice";
    case ErrorCode::IncompleteTrace: return "IncompleteTrace";
  }
  return "Unknown";
}

HpsError capacity_exceeded(const Device& d, std::size_t requested,
                           std::size_t budget, const std::string& what) {
  ErrorContext ctx;
  ctx.device = d;
  ctx.requested_bytes = requested;
  ctx.budget_bytes = budget;
  return HpsError(ErrorCode::CapacityExceeded,
                  what + ": " + d.to_string() + " cannot hold " + std::to_string(requested) +
                      " bytes (budget " + std::to_string(budget) + " bytes)",
                  std::move(ctx));
}

HpsError invalid_access(std::int64_t tensor_id, const std::string& what) {
  ErrorContext ctx;
  ctx.tensor_id = tensor_id;
  return HpsError(ErrorCode::InvalidAccess,
                  what + ": tensor " + std::to_string(tensor_id) + " is not registered",
                  std::move(ctx));
}

HpsError unsupported_device(const Device& d, const std::string& what) {
  ErrorContext ctx;
  ctx.device = d;
  return HpsError(ErrorCode::UnsupportedDevice,
                  what + ": device " + d.to_string() + " is not supported (expected cpu or cuda)",
                  std::move(ctx));
}

HpsError incomplete_trace(std::size_t trace_len, std::size_t moment, const std::string& what) {
  return HpsError(ErrorCode::IncompleteTrace,
                  what + ": trace holds " + std::to_string(trace_len) +
                      " samples at moment " + std::to_string(moment));
}

} // namespace core
} // namespace hps
