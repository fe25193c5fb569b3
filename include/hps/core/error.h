// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "hps/core/device.h"

namespace hps {
namespace core {

enum class ErrorCode : std::uint8_t {
  // Explicit numbering to keep numeric codes stable for future bindings.
  // Policy: append-only.
  CapacityExceeded = 0,
  InvalidAccess = 1,
  UnsupportedDevice = 2,
  IncompleteTrace = 3,
};

const char* to_string(ErrorCode code) noexcept;

namespace detail {
inline constexpr std::size_t kMaxErrorWhatBytes = 512;

inline std::string truncate_bytes(std::string s, std::size_t max) {
  if (s.size() <= max) return s;
  s.resize(max);
  return s;
}
} // namespace detail

// Structured context attached to every HpsError. Fields that do not apply to
// a given failure are left empty.
struct ErrorContext {
  std::optional<Device> device{};
  std::size_t requested_bytes{0};
  std::size_t budget_bytes{0};
  std::int64_t tensor_id{-1};
};

class HpsError : public std::runtime_error {
 public:
  HpsError(ErrorCode code, std::string message, ErrorContext ctx = {})
      : std::runtime_error(detail::truncate_bytes(std::move(message), detail::kMaxErrorWhatBytes)),
        code_(code),
        ctx_(std::move(ctx)) {}

  ErrorCode code() const noexcept { return code_; }
  const ErrorContext& context() const noexcept { return ctx_; }
  std::size_t requested_bytes() const noexcept { return ctx_.requested_bytes; }
  std::size_t budget_bytes() const noexcept { return ctx_.budget_bytes; }
  const std::optional<Device>& device() const noexcept { return ctx_.device; }

  // CapacityExceeded, InvalidAccess and UnsupportedDevice abort the iteration.
  bool is_fatal() const noexcept { return code_ != ErrorCode::IncompleteTrace; }

 private:
  ErrorCode code_;
  ErrorContext ctx_;
};

[[nodiscard]] HpsError capacity_exceeded(const Device& d, std::size_t requested,
                                         std::size_t budget, const std::string& what);
[[nodiscard]] HpsError invalid_access(std::int64_t tensor_id, const std::string& what);
[[nodiscard]] HpsError unsupported_device(const Device& d, const std::string& what);
[[nodiscard]] HpsError incomplete_trace(std::size_t trace_len, std::size_t moment,
                                        const std::string& what);

} // namespace core
} // namespace hps
