// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "hps/memory/memory_info.h"

#include <algorithm>
#include <fstream>

#include <unistd.h>

#include "hps/cpu/allocator.h"
#include "hps/logging/logging.h"

#if HPS_WITH_CUDA
#  include <cuda_runtime_api.h>
#endif

namespace hps {
namespace memory {

namespace {

std::size_t host_page_size() {
  long ps = sysconf(_SC_PAGESIZE);
  return ps > 0 ? static_cast<std::size_t>(ps) : 4096u;
}

#if HPS_WITH_CUDA
bool cuda_mem_get_info(int index, std::size_t& free_b, std::size_t& total_b) {
  int prev = 0;
  if (cudaGetDevice(&prev) != cudaSuccess) { (void)cudaGetLastError(); return false; }
  if (cudaSetDevice(index) != cudaSuccess) { (void)cudaGetLastError(); return false; }
  cudaError_t st = cudaMemGetInfo(&free_b, &total_b);
  (void)cudaSetDevice(prev);
  if (st != cudaSuccess) { (void)cudaGetLastError(); return false; }
  return true;
}
#endif

} // namespace

std::size_t SystemMemoryInfo::total_bytes(const core::Device& device) const {
  if (core::device_class(device) == core::DeviceClass::Cpu) {
    long pages = sysconf(_SC_PHYS_PAGES);
    return pages > 0 ? static_cast<std::size_t>(pages) * host_page_size() : 0;
  }
#if HPS_WITH_CUDA
  std::size_t free_b = 0, total_b = 0;
  if (cuda_mem_get_info(device.index, free_b, total_b)) return total_b;
  HPS_LOG(WARNING) << "cudaMemGetInfo failed for " << device.to_string();
#endif
  return 0;
}

std::size_t SystemMemoryInfo::used_bytes(const core::Device& device) const {
  if (core::device_class(device) == core::DeviceClass::Cpu) {
    // statm: size resident shared text lib data dt (in pages)
    std::ifstream statm("/proc/self/statm");
    std::size_t size_pages = 0, resident_pages = 0;
    std::size_t resident = 0;
    if (statm >> size_pages >> resident_pages) {
      resident = resident_pages * host_page_size();
    }
    // A payload counts as used from allocation on, even before its pages
    // become resident.
    return std::max(resident, cpu::Allocator::get().held_bytes());
  }
#if HPS_WITH_CUDA
  std::size_t free_b = 0, total_b = 0;
  if (cuda_mem_get_info(device.index, free_b, total_b)) return total_b - free_b;
#endif
  return 0;
}

} // namespace memory
} // namespace hps
