// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "math.hh"

#include "format.hh"

namespace ringkit {

std::string Vec2::ToStr() const { return f("Vec2({}, {})", x, y); }

std::string Rect::ToStr() const {
  return f("Rect(t={}, r={}, b={}, l={})", top, right, bottom, left);
}

}  // namespace ringkit
