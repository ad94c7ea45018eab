// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPoint.h>
#include <include/core/SkRect.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace ringkit {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kTau = 2 * kPi;

union Vec2 {
  struct {
    float x, y;
  };
  struct {
    float width, height;
  };
  SkPoint sk;

  constexpr Vec2() : x(0), y(0) {}
  constexpr Vec2(float x, float y) : x(x), y(y) {}
  constexpr Vec2(SkPoint p) : sk(p) {}
  static Vec2 Polar(float angle, float length) {
    return Vec2(cosf(angle) * length, sinf(angle) * length);
  }
  constexpr Vec2& operator+=(const Vec2& rhs) {
    x += rhs.x;
    y += rhs.y;
    return *this;
  }
  constexpr Vec2& operator-=(const Vec2& rhs) {
    x -= rhs.x;
    y -= rhs.y;
    return *this;
  }
  constexpr Vec2 operator-(const Vec2& rhs) const { return Vec2(x - rhs.x, y - rhs.y); }
  constexpr Vec2 operator-() const { return Vec2(-x, -y); }
  constexpr Vec2 operator+(const Vec2& rhs) const { return Vec2(x + rhs.x, y + rhs.y); }
  constexpr Vec2 operator*(float rhs) const { return Vec2(x * rhs, y * rhs); }
  constexpr Vec2 operator/(float rhs) const { return Vec2(x / rhs, y / rhs); }
  constexpr operator SkPoint() const { return sk; }
  constexpr bool operator==(const Vec2& rhs) const { return x == rhs.x && y == rhs.y; }
  constexpr bool operator!=(const Vec2& rhs) const { return !(*this == rhs); }
  std::string ToStr() const;
};

static_assert(sizeof(Vec2) == 8, "Vec2 is not 8 bytes");

constexpr float LengthSquared(Vec2 v) { return v.x * v.x + v.y * v.y; }
inline float Length(Vec2 v) { return sqrtf(LengthSquared(v)); }

// Point at `angle` radians (measured from the positive X axis towards the positive Y axis) on the
// circle with the given center & radius.
inline Vec2 PointOnCircle(Vec2 center, float radius, float angle) {
  return center + Vec2::Polar(angle, radius);
}

// Axis-aligned rectangle that aliases an SkRect.
//
// Coordinates follow Skia: the Y axis points down, so on screen `bottom` is the upper edge and
// `top` the lower one. The names are kept from the Y-up math these helpers started with. Only the
// order matters to ring code: `bottom` is the smaller Y bound (`fTop`) & `top` the larger one
// (`fBottom`).
union Rect {
  SkRect sk;
  struct {
    // Smaller x-axis bound.
    float left = 0;
    // Smaller y-axis bound (upper edge on screen).
    float bottom = 0;
    // Larger x-axis bound.
    float right = 0;
    // Larger y-axis bound (lower edge on screen).
    float top = 0;
  };

  constexpr Rect() = default;
  constexpr Rect(SkRect r) : sk(r) {}
  constexpr Rect(float left, float bottom, float right, float top)
      : left(left), bottom(bottom), right(right), top(top) {}

  // Make a rectangle with its minimum corner (top-left on screen) at (x, y).
  static constexpr Rect MakeXYWH(float x, float y, float width, float height) {
    return {x, y, x + width, y + height};
  }

  // Make a rectangle with its minimum corner at (0, 0).
  static constexpr Rect MakeCornerZero(float width, float height) { return {0, 0, width, height}; }

  operator SkRect&() { return sk; }
  operator const SkRect&() const { return sk; }

  constexpr float CenterY() const { return (top + bottom) / 2; }
  constexpr float CenterX() const { return (left + right) / 2; }
  constexpr float Width() const { return right - left; }
  constexpr float Height() const { return top - bottom; }
  constexpr Vec2 Center() const { return {CenterX(), CenterY()}; }

  // The largest square that fits in this rectangle, sharing its center.
  constexpr Rect CenteredSquare() const {
    float dim = std::min(Width(), Height());
    float dx = (Width() - dim) / 2;
    float dy = (Height() - dim) / 2;
    return {left + dx, bottom + dy, left + dx + dim, bottom + dy + dim};
  }

  [[nodiscard]] constexpr Rect Outset(float amount) const {
    return {left - amount, bottom - amount, right + amount, top + amount};
  }

  [[nodiscard]] constexpr Rect Inset(float amount) const { return Outset(-amount); }

  constexpr bool operator==(const Rect& other) const {
    return left == other.left && bottom == other.bottom && right == other.right &&
           top == other.top;
  }

  std::string ToStr() const;
};

constexpr Rect CenteredSquare(const Rect& rect) { return rect.CenteredSquare(); }

}  // namespace ringkit
