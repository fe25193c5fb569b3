// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "hps/core/data_ptr.h"
#include "hps/core/device.h"

namespace hps {
namespace memory {

// Storage provider for chunk payloads. Every copy is complete when copy()
// returns; callers never observe a half-migrated buffer.
class MemoryBackend {
 public:
  virtual ~MemoryBackend() = default;

  virtual core::DataPtr allocate(const core::Device& device, std::size_t nbytes) = 0;
  virtual void copy(void* dst, const core::Device& dst_device,
                    const void* src, const core::Device& src_device,
                    std::size_t nbytes) = 0;
  virtual void fill_zero(void* dst, const core::Device& device, std::size_t nbytes) = 0;
  virtual const char* name() const noexcept = 0;
};

// Serves every device class out of host memory. Accelerator chunks are
// simulated, which keeps CPU-only builds and tests on the same code path.
class HostBackend final : public MemoryBackend {
 public:
  core::DataPtr allocate(const core::Device& device, std::size_t nbytes) override;
  void copy(void* dst, const core::Device& dst_device,
            const void* src, const core::Device& src_device,
            std::size_t nbytes) override;
  void fill_zero(void* dst, const core::Device& device, std::size_t nbytes) override;
  const char* name() const noexcept override { return "host"; }

  std::uint64_t copy_count() const noexcept { return copies_; }
  std::uint64_t bytes_copied() const noexcept { return bytes_copied_; }

 private:
  std::uint64_t copies_{0};
  std::uint64_t bytes_copied_{0};
};

#if HPS_WITH_CUDA
// Accelerator chunks live in cudaMalloc'd memory; host chunks come from the
// cpu allocator. Copies go through a dedicated non-blocking stream and are
// synchronized before returning.
class CudaBackend final : public MemoryBackend {
 public:
  explicit CudaBackend(int device_index);
  ~CudaBackend() override;

  CudaBackend(const CudaBackend&) = delete;
  CudaBackend& operator=(const CudaBackend&) = delete;

  core::DataPtr allocate(const core::Device& device, std::size_t nbytes) override;
  void copy(void* dst, const core::Device& dst_device,
            const void* src, const core::Device& src_device,
            std::size_t nbytes) override;
  void fill_zero(void* dst, const core::Device& device, std::size_t nbytes) override;
  const char* name() const noexcept override { return "cuda"; }

 private:
  int device_index_{0};
  std::uintptr_t copy_stream_{0};  // cudaStream_t as integer
};
#endif

// Returns the CUDA backend when built with HPS_WITH_CUDA and a device is
// present, otherwise a HostBackend.
std::unique_ptr<MemoryBackend> make_default_backend(int device_index = 0);

} // namespace memory
} // namespace hps
