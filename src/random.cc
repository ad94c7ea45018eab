// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "random.hh"

#include <chrono>

#include "format.hh"

namespace ringkit {

XorShift32 XorShift32::MakeFromSeed(uint64_t seed) {
  SplitMix64 mix(seed);
  uint64_t z = mix.Next();
  return XorShift32((uint32_t)z ^ (uint32_t)(z >> 32));
}

XorShift32 XorShift32::MakeFromCurrentTime() {
  auto now = std::chrono::system_clock::now().time_since_epoch().count();
  return MakeFromSeed((uint64_t)now ^ 0xdeadbeef);
}

std::string Range::ToStr() const { return f("[{}, {}]", min, max); }

std::string IntRange::ToStr() const { return f("[{}, {}]", min, max); }

}  // namespace ringkit
