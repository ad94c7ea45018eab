// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <algorithm>
#include <cstdint>
#include <string>

namespace ringkit {

struct SplitMix64 {
  uint64_t state;

  SplitMix64(uint64_t seed) : state(seed) {}

  uint64_t Next() {
    uint64_t z = (state += 0x9e3779b97f4a7c15);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9;
    z = (z ^ (z >> 27)) * 0x94d049bb133111eb;
    return z ^ (z >> 31);
  }
};

// Small & fast pseudo-random generator. Every randomized ring constructor takes one of these, so
// seeding it with a fixed value makes the generated spans reproducible.
struct XorShift32 {
  uint32_t state;

  explicit XorShift32(uint32_t seed) : state(seed ? seed : 0xdeadbeef) {}

  // Spreads a 64-bit seed so that nearby seeds produce unrelated sequences.
  static XorShift32 MakeFromSeed(uint64_t seed);
  static XorShift32 MakeFromCurrentTime();

  uint32_t Next() {
    uint32_t x = state;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    return state = x;
  }

  // Returns a value in [0, 1).
  float RollUnit() { return (Next() >> 8) * (1.f / (1 << 24)); }

  // Returns a value in [min, max). Returns `min` when the range is empty.
  float RollFloat(float min, float max) { return min + RollUnit() * (max - min); }

  // Returns a value in [min, max] (both inclusive).
  int RollInt(int min, int max) {
    if (max <= min) {
      return min;
    }
    return min + (int)(Next() % (uint32_t)(max - min + 1));
  }
};

// Closed range of floats used by the randomized constructors.
struct Range {
  float min = 0;
  float max = 0;

  // Returns the range with `min` & `max` swapped if they were given in the wrong order.
  Range Sorted() const { return min <= max ? *this : Range{max, min}; }
  float Roll(XorShift32& rng) const {
    Range r = Sorted();
    return rng.RollFloat(r.min, r.max);
  }
  std::string ToStr() const;
};

// Closed range of integers used by the randomized constructors.
struct IntRange {
  int min = 0;
  int max = 0;

  IntRange Sorted() const { return min <= max ? *this : IntRange{max, min}; }
  // Returns the range with both ends moved into [floor, ceiling].
  IntRange Clamp(int floor, int ceiling) const {
    IntRange r = Sorted();
    return {std::clamp(r.min, floor, ceiling), std::clamp(r.max, floor, ceiling)};
  }
  int Roll(XorShift32& rng) const {
    IntRange r = Sorted();
    return rng.RollInt(r.min, r.max);
  }
  std::string ToStr() const;
};

}  // namespace ringkit
