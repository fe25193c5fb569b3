// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "hps/manager/config.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace hps {
namespace manager {

ManagerConfig ManagerConfig::parse(const std::string& s) {
  ManagerConfig cfg;
  auto is_space = [](char c){ return c==' '||c=='\t'||c=='\n' || c=='\r'; };
  auto trim = [&](std::string& t){ std::size_t a=0; while (a<t.size() && is_space(t[a])) ++a; std::size_t b=t.size(); while (b>a && is_space(t[b-1])) --b; t = t.substr(a, b-a); };
  auto to_uint = [&](const std::string& t, std::size_t& out)->bool{
    if (t.empty() || t[0]=='-') return false; char* end=nullptr; errno=0; unsigned long long x = std::strtoull(t.c_str(), &end, 10);
    if (errno!=0 || (end && *end!='\0')) return false; out = static_cast<std::size_t>(x); return true; };
  auto to_double = [&](const std::string& t, double& out)->bool{
    if (t.empty()) return false; char* end=nullptr; errno=0; double x = std::strtod(t.c_str(), &end);
    if (errno!=0 || (end && *end!='\0')) return false; out = x; return true; };
  auto to_bool = [&](const std::string& t, bool& out)->bool{
    std::string u=t; for (auto& c: u) c = (char)std::tolower(c);
    if (u=="1"||u=="true"||u=="yes") { out=true; return true; }
    if (u=="0"||u=="false"||u=="no") { out=false; return true; }
    return false; };
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && (is_space(s[i]) || s[i]==',')) ++i; if (i>=s.size()) break;
    std::size_t k0=i; while (i<s.size() && s[i] != '=' && s[i] != ',') ++i; if (i>=s.size()|| s[i] != '=') break; std::string key = s.substr(k0, i-k0); ++i;
    std::size_t v0=i; while (i<s.size() && s[i] != ',') ++i; std::string val = s.substr(v0, i-v0);
    trim(key); trim(val);
    if (key == "overall_gpu_mem_ratio") { double v=0; if (to_double(val, v)) cfg.overall_gpu_mem_ratio = v; }
    else if (key == "overall_cpu_mem_ratio") { double v=0; if (to_double(val, v)) cfg.overall_cpu_mem_ratio = v; }
    else if (key == "margin_use_ratio") { double v=0; if (to_double(val, v)) cfg.margin_use_ratio = v; }
    else if (key == "warmup_gpu_chunk_mem_ratio") { double v=0; if (to_double(val, v)) cfg.warmup_gpu_chunk_mem_ratio = v; }
    else if (key == "use_fake_dist") { bool b=false; if (to_bool(val, b)) cfg.use_fake_dist = b; }
    else if (key == "always_warmup") { bool b=false; if (to_bool(val, b)) cfg.always_warmup = b; }
    else if (key == "world_size") { std::size_t v=0; if (to_uint(val, v)) cfg.world_size = static_cast<int>(v); }
    else if (key == "local_rank") { std::size_t v=0; if (to_uint(val, v)) cfg.local_rank = static_cast<int>(v); }
    else if (key == "gpu_capacity_bytes") { std::size_t v=0; if (to_uint(val, v)) cfg.gpu_capacity_bytes = v; }
    else if (key == "cpu_capacity_bytes") { std::size_t v=0; if (to_uint(val, v)) cfg.cpu_capacity_bytes = v; }
  }
  return cfg;
}

ManagerConfig ManagerConfig::from_env() {
  const char* env = std::getenv("HPS_MANAGER_CONF");
  if (!env || !*env) return ManagerConfig{};
  return parse(std::string(env));
}

void ManagerConfig::validate() const {
  auto check_ratio = [](double v, const char* name) {
    if (!(v > 0.0 && v <= 1.0)) {
      throw std::invalid_argument(std::string("ManagerConfig: ") + name + " must be in (0, 1]");
    }
  };
  check_ratio(overall_gpu_mem_ratio, "overall_gpu_mem_ratio");
  check_ratio(overall_cpu_mem_ratio, "overall_cpu_mem_ratio");
  check_ratio(margin_use_ratio, "margin_use_ratio");
  check_ratio(warmup_gpu_chunk_mem_ratio, "warmup_gpu_chunk_mem_ratio");
  if (world_size < 1) throw std::invalid_argument("ManagerConfig: world_size must be >= 1");
  if (local_rank < 0) throw std::invalid_argument("ManagerConfig: local_rank must be >= 0");
}

} // namespace manager
} // namespace hps
