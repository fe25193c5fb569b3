// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "hps/core/device.h"
#include "hps/core/error.h"

namespace hps {
namespace core {

DeviceClass device_class(const Device& d) {
  if (d.is_cpu()) return DeviceClass::Cpu;
  if (d.is_cuda()) return DeviceClass::Accelerator;
  throw unsupported_device(d, "device_class");
}

} // namespace core
} // namespace hps
