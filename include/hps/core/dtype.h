// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

// Reuse DLPack types; do not define our own enums
#include <dlpack/dlpack.h>

namespace hps {
namespace core {

// Element type of chunk payloads (append-only for ABI stability)
enum class ScalarType : uint8_t {
  Bool,
  Int32,
  Int64,
  Float32,
  Float16,
  BFloat16,
  Float64,
  Undefined = 255
};

static_assert(static_cast<uint8_t>(ScalarType::Bool) == 0);
static_assert(static_cast<uint8_t>(ScalarType::Float32) == 3);
static_assert(static_cast<uint8_t>(ScalarType::Undefined) == 255);

inline constexpr std::size_t itemsize(ScalarType t) {
  switch (t) {
    case ScalarType::Bool: return 1;
    case ScalarType::Int32: return 4;
    case ScalarType::Int64: return 8;
    case ScalarType::Float32: return 4;
    case ScalarType::Float16: return 2;
    case ScalarType::BFloat16: return 2;
    case ScalarType::Float64: return 8;
    case ScalarType::Undefined: return 0;
  }
  return 0;
}

inline constexpr const char* to_string(ScalarType t) {
  switch (t) {
    case ScalarType::Bool: return "bool";
    case ScalarType::Int32: return "int32";
    case ScalarType::Int64: return "int64";
    case ScalarType::Float32: return "float32";
    case ScalarType::Float16: return "float16";
    case ScalarType::BFloat16: return "bfloat16";
    case ScalarType::Float64: return "float64";
    case ScalarType::Undefined: return "undefined";
  }
  return "undefined";
}

// Map to DLPack dtype
inline constexpr DLDataType to_dlpack_dtype(ScalarType t) {
  switch (t) {
    case ScalarType::Bool: return DLDataType{static_cast<uint8_t>(kDLBool), 8, 1};
    case ScalarType::Int32: return DLDataType{static_cast<uint8_t>(kDLInt), 32, 1};
    case ScalarType::Int64: return DLDataType{static_cast<uint8_t>(kDLInt), 64, 1};
    case ScalarType::Float32: return DLDataType{static_cast<uint8_t>(kDLFloat), 32, 1};
    case ScalarType::Float16: return DLDataType{static_cast<uint8_t>(kDLFloat), 16, 1};
    case ScalarType::BFloat16: return DLDataType{static_cast<uint8_t>(kDLBfloat), 16, 1};
    case ScalarType::Float64: return DLDataType{static_cast<uint8_t>(kDLFloat), 64, 1};
    case ScalarType::Undefined: break;
  }
  return DLDataType{static_cast<uint8_t>(kDLFloat), 0, 1};
}

} // namespace core
} // namespace hps
