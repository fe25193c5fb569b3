// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "hps/client/client.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "hps/core/error.h"
#include "hps/logging/logging.h"

namespace hps {
namespace client {

using chunk::Chunk;
using chunk::ChunkId;
using chunk::TensorId;
using chunk::TensorRecord;
using chunk::TensorStatus;

std::size_t TensorView::numel() const noexcept {
  std::size_t n = 1;
  for (auto d : shape) n *= static_cast<std::size_t>(d);
  return n;
}

DLTensor TensorView::to_dltensor() const noexcept {
  DLTensor t{};
  t.data = data;
  t.device = DLDevice{device.type, device.index};
  t.ndim = static_cast<int32_t>(shape.size());
  t.dtype = core::to_dlpack_dtype(dtype);
  t.shape = const_cast<int64_t*>(shape.data());
  t.strides = nullptr;  // compact row-major
  t.byte_offset = 0;
  return t;
}

Client::Client(manager::MemoryManager& manager, memory::MemoryBackend& backend, const ClientOptions& opts)
    : Client(manager, backend, opts, DeviceTopology::two_tier(opts.accelerator)) {}

Client::Client(manager::MemoryManager& manager, memory::MemoryBackend& backend, const ClientOptions& opts,
               DeviceTopology topology)
    : manager_(&manager),
      backend_(&backend),
      opts_(opts),
      topology_(std::move(topology)),
      chunk_list_(opts.default_chunk_size, opts.dtype, opts.default_device, backend) {
  if (core::device_class(opts_.accelerator) != core::DeviceClass::Accelerator) {
    throw core::unsupported_device(opts_.accelerator, "Client: accelerator must be a cuda device");
  }
}

TensorId Client::generate_id() {
  while (chunk_list_.chunk_of(next_id_)) ++next_id_;
  return next_id_++;
}

Client::Entry& Client::entry_or_throw(TensorHandle handle, const char* what) {
  auto it = entries_.find(handle);
  if (it == entries_.end()) throw core::invalid_access(static_cast<std::int64_t>(handle), what);
  return it->second;
}

const Client::Entry& Client::entry_or_throw(TensorHandle handle, const char* what) const {
  auto it = entries_.find(handle);
  if (it == entries_.end()) throw core::invalid_access(static_cast<std::int64_t>(handle), what);
  return it->second;
}

chunk::ChunkList::Allocation Client::new_tensor(std::size_t numel, TensorId tensor_id) {
  if (!chunk_list_.find_fit(numel)) {
    const std::size_t cap = chunk_list_.new_chunk_capacity(numel);
    prepare_device(chunk_list_.default_device(), cap * core::itemsize(chunk_list_.dtype()));
  }
  chunk::ChunkList::Allocation a = chunk_list_.allocate(numel, tensor_id);
  if (a.new_chunk) {
    const Chunk& c = chunk_list_[a.chunk_id];
    manager_->add(c.device(), c.nbytes());
  }
  HPS_DLOG(INFO) << "allocated tensor " << tensor_id << " (" << numel << " elements) on chunk "
                 << a.chunk_id << " at offset " << a.offset;
  return a;
}

void Client::bind(TensorHandle handle, AccessType kind, Binding& b,
                  const std::vector<std::int64_t>& shape, const void* init) {
  b.id = generate_id();
  b.view.shape = shape;
  b.view.dtype = chunk_list_.dtype();
  chunk::ChunkList::Allocation a = new_tensor(b.view.numel(), b.id);
  Chunk& c = chunk_list_[a.chunk_id];
  const TensorRecord* rec = c.find(b.id);
  b.view.data = c.tensor_data(*rec);
  b.view.device = c.device();
  owners_[b.id] = Owner{handle, kind};
  if (init != nullptr) {
    backend_->copy(b.view.data, b.view.device, init, core::Device::cpu(), b.view.nbytes());
    c.set_tensor_status(b.id, TensorStatus::Hold);
  } else if (kind == AccessType::Data) {
    backend_->fill_zero(b.view.data, b.view.device, b.view.nbytes());
    c.set_tensor_status(b.id, TensorStatus::Hold);
  }
}

void Client::register_tensor(TensorHandle handle, const TensorSpec& spec) {
  if (is_registered(handle)) {
    HPS_DLOG(INFO) << "tensor handle " << handle << " is already registered";
    return;
  }
  if (spec.dtype != chunk_list_.dtype()) {
    throw std::invalid_argument(std::string("Client::register_tensor: dtype ") + core::to_string(spec.dtype) +
                                " does not match chunk dtype " + core::to_string(chunk_list_.dtype()));
  }
  for (auto d : spec.shape) {
    if (d < 0) throw std::invalid_argument("Client::register_tensor: negative dimension");
  }
  (void)core::device_class(spec.compute_device);

  // The entry goes in first so that chunk moves triggered while binding the
  // grad payload rebind the data view too.
  Entry& e = entries_[handle];
  e.compute_device = spec.compute_device;
  try {
    bind(handle, AccessType::Data, e.data, spec.shape, spec.init_data);
    bind(handle, AccessType::Grad, e.grad, spec.shape, spec.init_grad);
  } catch (...) {
    // Grad first: its extent, if any, sits after the data extent.
    for (const Binding* b : {&e.grad, &e.data}) {
      if (b->id < 0) continue;
      owners_.erase(b->id);
      if (chunk_list_.chunk_of(b->id) && !chunk_list_.pop(b->id)) {
        HPS_LOG(WARNING) << "tensor " << b->id << " of handle " << handle << " keeps its chunk extent";
      }
    }
    entries_.erase(handle);
    throw;
  }
}

void Client::register_tensors(const std::vector<std::pair<TensorHandle, TensorSpec>>& tensors) {
  for (const auto& t : tensors) register_tensor(t.first, t.second);
}

bool Client::is_registered(TensorHandle handle) const noexcept {
  return entries_.find(handle) != entries_.end();
}

void Client::prepare_device(const core::Device& device, std::size_t need_bytes) {
  HPS_DLOG(INFO) << "prepare_device " << device.to_string() << " need " << need_bytes << " bytes";
  const std::size_t max = manager_->max_mem(device);
  if (max < need_bytes) {
    HPS_LOG(ERROR) << device.to_string() << " has not enough space for " << need_bytes << " bytes";
    throw core::capacity_exceeded(device, need_bytes, max, "Client::prepare_device");
  }
  const std::int64_t extra = static_cast<std::int64_t>(need_bytes) - manager_->free_chunk_mem(metronome_, device);
  if (extra <= 0) return;

  HPS_DLOG(INFO) << device.to_string() << " is short by " << extra << " bytes";
  std::vector<ChunkId> victims = chunk_list_.make_room(static_cast<std::size_t>(extra), device);
  evict(victims, device);
}

void Client::evict(const std::vector<ChunkId>& victims, const core::Device& from) {
  if (victims.empty()) return;
  const core::Device target = topology_.evict_target(from);
  for (ChunkId id : victims) chunk_move(id, target);
}

void Client::chunk_move(ChunkId chunk_id, const core::Device& device) {
  Chunk& c = chunk_list_[chunk_id];
  if (c.device() == device) return;
  const std::size_t nbytes = c.nbytes();
  const std::size_t used = manager_->used_chunk_mem(device);
  const std::size_t max = manager_->max_mem(device);
  if (used + nbytes > max) {
    throw core::capacity_exceeded(device, nbytes, max - std::min(used, max),
                                  "Client::chunk_move(chunk " + std::to_string(chunk_id) + ")");
  }
  const core::Device src = c.device();
  HPS_DLOG(INFO) << "move chunk " << chunk_id << " from " << src.to_string() << " to " << device.to_string();
  c.move(device, [this](const TensorRecord& rec, void* data, const core::Device& dev) {
    auto it = owners_.find(rec.tensor_id);
    if (it == owners_.end()) return;
    auto e = entries_.find(it->second.handle);
    if (e == entries_.end()) return;
    TensorView& v = e->second.get(it->second.kind).view;
    v.data = data;
    v.device = dev;
  });
  HPS_CHECK(c.device() == device) << "chunk " << chunk_id << " did not reach " << device.to_string();
  manager_->remove(src, nbytes);
  manager_->add(device, nbytes);
}

void Client::access(TensorHandle handle, AccessType kind) {
  Entry& e = entry_or_throw(handle, "Client::access");
  const Binding& b = e.get(kind);
  const ChunkId chunk_id = *chunk_list_.chunk_of(b.id);
  Chunk& c = chunk_list_[chunk_id];

  if (c.device() != e.compute_device) {
    prepare_device(e.compute_device, c.nbytes());
    chunk_move(chunk_id, e.compute_device);
  }
  c.set_tensor_status(b.id, TensorStatus::Compute, static_cast<std::int64_t>(metronome_.moment()));
  chunk_list_.touch(chunk_id);
}

void Client::release(TensorHandle handle, AccessType kind) {
  Entry& e = entry_or_throw(handle, "Client::release");
  const Binding& b = e.get(kind);
  chunk_list_[*chunk_list_.chunk_of(b.id)].set_tensor_status(b.id, TensorStatus::Hold);
}

const TensorView& Client::view(TensorHandle handle, AccessType kind) const {
  return entry_or_throw(handle, "Client::view").get(kind).view;
}

TensorId Client::tensor_id(TensorHandle handle, AccessType kind) const {
  return entry_or_throw(handle, "Client::tensor_id").get(kind).id;
}

const TensorRecord& Client::record(TensorHandle handle, AccessType kind) const {
  const TensorId id = tensor_id(handle, kind);
  return *chunk_list_[*chunk_list_.chunk_of(id)].find(id);
}

void Client::start_train(std::size_t param_budget_bytes) {
  manager_->start_train(metronome_, param_budget_bytes, opts_.default_chunk_size);
}

void Client::end_iteration() {
  const std::size_t moment = metronome_.moment();
  if (metronome_.is_warmup()) {
    const std::size_t n = manager_->trace(core::DeviceClass::Accelerator).sys_used.size();
    if (n != moment) throw core::incomplete_trace(n, moment, "Client::end_iteration");
    metronome_.reset();
    if (manager_->config().always_warmup) {
      manager_->reset_memory_stats();
    } else {
      metronome_.set_warmup(false);
      HPS_LOG(INFO) << "Warmup finished after " << moment << " moments";
    }
    return;
  }
  const auto& total = metronome_.total_moments();
  if (!total || *total != moment) {
    throw core::incomplete_trace(total ? *total : 0, moment, "Client::end_iteration");
  }
  metronome_.reset();
}

void Client::reset_memory_stats() {
  manager_->reset_memory_stats();
  if (metronome_.is_warmup()) {
    metronome_.rewind();
  } else if (metronome_.total_moments()) {
    // Steady state lost its trace, so the next iteration records a new one.
    metronome_.restart_warmup();
    HPS_LOG(INFO) << "Trace discarded after warmup; warming up again";
  }
}

void Client::allreduce(TensorHandle handle, AccessType kind, const CollectiveHook& hook) {
  const TensorView& v = view(handle, kind);
  HPS_DLOG(INFO) << "allreduce " << to_string(kind) << " of " << handle << " on " << v.device.to_string();
  if (hook) hook(v);
}

void Client::broadcast(TensorHandle handle, AccessType kind, const CollectiveHook& hook) {
  const TensorView& v = view(handle, kind);
  HPS_DLOG(INFO) << "broadcast " << to_string(kind) << " of " << handle << " on " << v.device.to_string();
  if (hook) hook(v);
}

void Client::visit() const {
  for (const auto& c : chunk_list_.chunks()) {
    HPS_LOG(INFO) << "chunk " << c->id() << " on " << c->device().to_string() << " "
                  << chunk::to_string(c->status()) << " used " << c->used() << "/" << c->capacity();
    for (const auto& rec : c->tensors()) {
      HPS_LOG(INFO) << "  tensor " << rec.tensor_id << " offset " << rec.offset << " numel "
                    << rec.numel << " " << chunk::to_string(rec.status);
    }
  }
}

} // namespace client
} // namespace hps
