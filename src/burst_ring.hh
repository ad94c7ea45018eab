// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkCanvas.h>
#include <include/core/SkColor.h>
#include <include/core/SkPath.h>

#include <string>
#include <vector>

#include "math.hh"
#include "random.hh"

namespace ringkit {

// Ring band filled with a background color and crossed by many thin radial spokes.
//
// Unlike the other rings this one draws directly onto a canvas, because it needs two colors and a
// clip. The geometry is still available through `RaysPath` & `ClipPath`.
struct BurstRing {
  struct Spoke {
    // Center angle of the spoke, in degrees.
    float angle;
    // Angular width of the spoke, in degrees.
    float width;

    std::string ToStr() const;
  };

  // Width of the band, in the units of the bounding rectangle.
  float thickness;
  std::vector<Spoke> spokes;

  BurstRing(float thickness, std::vector<Spoke> spokes);

  static BurstRing Random(XorShift32& rng, float thickness, Range width_range = {0.5f, 1.2f},
                          Range spacing_range = {0.5f, 4.f});

  // Union of pie slices (one per spoke) going from the center to the edge of the centered square.
  SkPath RaysPath(Rect rect) const;

  // Annulus between the centered square's circle and the circle inset by `thickness`.
  SkPath ClipPath(Rect rect) const;

  void Draw(SkCanvas& canvas, Rect rect, SkColor background, SkColor foreground) const;
};

// Walks around the circle from a random rotation, alternating a spoke of random width and a gap of
// random spacing until a full turn is covered. Widths & spacings are in degrees.
std::vector<BurstRing::Spoke> RandomSpokes(XorShift32& rng, Range width_range = {0.5f, 1.2f},
                                           Range spacing_range = {0.5f, 4.f});

}  // namespace ringkit
