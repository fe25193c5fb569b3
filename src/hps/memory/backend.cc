// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "hps/memory/backend.h"

#include <cstring>
#include <stdexcept>
#include <string>

#include "hps/core/error.h"
#include "hps/cpu/allocator.h"
#include "hps/logging/logging.h"

#ifndef HPS_WITH_CUDA
#  error "HPS_WITH_CUDA must be defined (0/1)"
#endif
static_assert(HPS_WITH_CUDA == 0 || HPS_WITH_CUDA == 1, "HPS_WITH_CUDA must be 0 or 1");

#if HPS_WITH_CUDA
#  include <cuda_runtime_api.h>
#endif

namespace hps {
namespace memory {

namespace {

core::DataPtr host_allocate(std::size_t nbytes) {
  void* p = cpu::Allocator::get().raw_alloc(nbytes);
  return core::DataPtr(p, [](void* q) noexcept { cpu::Allocator::get().raw_delete(q); });
}

#if HPS_WITH_CUDA
void cuda_check(cudaError_t st, const char* what) {
  if (st != cudaSuccess) {
    throw std::runtime_error(std::string(what) + ": " + cudaGetErrorString(st));
  }
}

cudaStream_t as_stream(std::uintptr_t h) { return reinterpret_cast<cudaStream_t>(h); }
#endif

} // namespace

core::DataPtr HostBackend::allocate(const core::Device& device, std::size_t nbytes) {
  // Validates the device class; the bytes always come from host memory.
  (void)core::device_class(device);
  return host_allocate(nbytes);
}

void HostBackend::copy(void* dst, const core::Device& dst_device,
                       const void* src, const core::Device& src_device,
                       std::size_t nbytes) {
  (void)core::device_class(dst_device);
  (void)core::device_class(src_device);
  if (nbytes == 0) return;
  std::memcpy(dst, src, nbytes);
  ++copies_;
  bytes_copied_ += nbytes;
}

void HostBackend::fill_zero(void* dst, const core::Device& device, std::size_t nbytes) {
  (void)core::device_class(device);
  if (nbytes == 0) return;
  std::memset(dst, 0, nbytes);
}

#if HPS_WITH_CUDA
CudaBackend::CudaBackend(int device_index) : device_index_(device_index) {
  cuda_check(cudaSetDevice(device_index_), "CudaBackend: cudaSetDevice");
  cudaStream_t s = nullptr;
  cuda_check(cudaStreamCreateWithFlags(&s, cudaStreamNonBlocking), "CudaBackend: cudaStreamCreateWithFlags");
  copy_stream_ = reinterpret_cast<std::uintptr_t>(s);
}

CudaBackend::~CudaBackend() {
  if (copy_stream_ != 0) {
    (void)cudaStreamDestroy(as_stream(copy_stream_));
  }
}

core::DataPtr CudaBackend::allocate(const core::Device& device, std::size_t nbytes) {
  if (core::device_class(device) == core::DeviceClass::Cpu) {
    return host_allocate(nbytes);
  }
  cuda_check(cudaSetDevice(device.index), "CudaBackend::allocate: cudaSetDevice");
  void* p = nullptr;
  cudaError_t st = cudaMalloc(&p, nbytes);
  if (st != cudaSuccess) {
    (void)cudaGetLastError();
    throw core::capacity_exceeded(device, nbytes, 0, std::string("CudaBackend::allocate: ") + cudaGetErrorString(st));
  }
  return core::DataPtr(p, [](void* q) noexcept { (void)cudaFree(q); });
}

void CudaBackend::copy(void* dst, const core::Device& dst_device,
                       const void* src, const core::Device& src_device,
                       std::size_t nbytes) {
  if (nbytes == 0) return;
  const bool dst_acc = core::device_class(dst_device) == core::DeviceClass::Accelerator;
  const bool src_acc = core::device_class(src_device) == core::DeviceClass::Accelerator;
  cudaMemcpyKind kind = cudaMemcpyHostToHost;
  if (src_acc && dst_acc) kind = cudaMemcpyDeviceToDevice;
  else if (src_acc) kind = cudaMemcpyDeviceToHost;
  else if (dst_acc) kind = cudaMemcpyHostToDevice;
  if (kind == cudaMemcpyHostToHost) {
    std::memcpy(dst, src, nbytes);
    return;
  }
  cuda_check(cudaMemcpyAsync(dst, src, nbytes, kind, as_stream(copy_stream_)), "CudaBackend::copy: cudaMemcpyAsync");
  // Migration is a blocking step of the access path.
  cuda_check(cudaStreamSynchronize(as_stream(copy_stream_)), "CudaBackend::copy: cudaStreamSynchronize");
}

void CudaBackend::fill_zero(void* dst, const core::Device& device, std::size_t nbytes) {
  if (nbytes == 0) return;
  if (core::device_class(device) == core::DeviceClass::Cpu) {
    std::memset(dst, 0, nbytes);
    return;
  }
  cuda_check(cudaMemsetAsync(dst, 0, nbytes, as_stream(copy_stream_)), "CudaBackend::fill_zero: cudaMemsetAsync");
  cuda_check(cudaStreamSynchronize(as_stream(copy_stream_)), "CudaBackend::fill_zero: cudaStreamSynchronize");
}
#endif

std::unique_ptr<MemoryBackend> make_default_backend(int device_index) {
#if HPS_WITH_CUDA
  int count = 0;
  if (cudaGetDeviceCount(&count) == cudaSuccess && device_index < count) {
    HPS_LOG(INFO) << "Using CUDA memory backend on device " << device_index;
    return std::make_unique<CudaBackend>(device_index);
  }
  (void)cudaGetLastError();
#endif
  (void)device_index;
  HPS_LOG(INFO) << "Using host memory backend; accelerator chunks are simulated in host memory";
  return std::make_unique<HostBackend>();
}

} // namespace memory
} // namespace hps
