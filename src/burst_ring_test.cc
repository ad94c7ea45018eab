// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "burst_ring.hh"

#include <include/core/SkImageInfo.h>
#include <include/core/SkPixmap.h>
#include <include/core/SkSurface.h>

#include "gtest.hh"

using namespace ringkit;

TEST(BurstRingTest, SpokesCoverFullTurn) {
  for (uint64_t seed = 0; seed < 10; ++seed) {
    XorShift32 rng = XorShift32::MakeFromSeed(seed);
    auto spokes = RandomSpokes(rng);
    ASSERT_GE(spokes.size(), 360 / 5.2f);
    ASSERT_LE(spokes.size(), 360);
    float first = spokes.front().angle;
    for (int i = 0; i < spokes.size(); ++i) {
      EXPECT_GE(spokes[i].width, 0.5f);
      EXPECT_LT(spokes[i].width, 1.2f);
      if (i > 0) {
        float step = spokes[i].angle - spokes[i - 1].angle;
        EXPECT_GE(step, spokes[i - 1].width + 0.5f - 1e-3);
        EXPECT_LE(step, spokes[i - 1].width + 4 + 1e-3);
      }
    }
    EXPECT_GE(first, 0);
    EXPECT_LT(first, 360);
    // The walk stops once the next spoke would start past the full turn.
    float last = spokes.back().angle - first;
    EXPECT_LT(last, 360);
    EXPECT_GE(last + spokes.back().width + 4 + 1e-3, 360);
  }
}

TEST(BurstRingTest, SeededSpokesAreReproducible) {
  XorShift32 a = XorShift32::MakeFromSeed(11);
  XorShift32 b = XorShift32::MakeFromSeed(11);
  auto spokes_a = RandomSpokes(a);
  auto spokes_b = RandomSpokes(b);
  ASSERT_EQ(spokes_a.size(), spokes_b.size());
  for (int i = 0; i < spokes_a.size(); ++i) {
    EXPECT_EQ(spokes_a[i].angle, spokes_b[i].angle);
    EXPECT_EQ(spokes_a[i].width, spokes_b[i].width);
  }
}

TEST(BurstRingTest, DegenerateRangesStillTerminate) {
  XorShift32 rng(1);
  auto spokes = RandomSpokes(rng, {0, 0}, {-1, -1});
  EXPECT_GT(spokes.size(), 30000);
  EXPECT_LT(spokes.size(), 40000);
}

TEST(BurstRingTest, ClipPathIsAnnulus) {
  BurstRing burst(20, {});
  SkPath clip = burst.ClipPath(Rect::MakeCornerZero(200, 200));
  EXPECT_TRUE(clip.contains(195, 100));
  EXPECT_TRUE(clip.contains(100, 15));
  EXPECT_FALSE(clip.contains(100, 100));
  EXPECT_FALSE(clip.contains(150, 100));
  EXPECT_FALSE(clip.contains(2, 2));
}

TEST(BurstRingTest, RaysAreWedges) {
  BurstRing burst(20, {{.angle = 0, .width = 10}, {.angle = 180, .width = 10}});
  SkPath rays = burst.RaysPath(Rect::MakeCornerZero(200, 200));
  EXPECT_TRUE(rays.contains(150, 100));
  EXPECT_TRUE(rays.contains(50, 100));
  EXPECT_FALSE(rays.contains(100, 150));
  EXPECT_FALSE(rays.contains(100, 50));
}

TEST(BurstRingTest, DrawPaintsBandOnly) {
  auto surface = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(200, 200));
  ASSERT_NE(surface, nullptr);
  SkCanvas& canvas = *surface->getCanvas();
  canvas.clear(SK_ColorWHITE);
  BurstRing burst(40, {{.angle = 0, .width = 10}});
  burst.Draw(canvas, Rect::MakeCornerZero(200, 200), SK_ColorRED, SK_ColorGREEN);
  SkPixmap pixmap;
  ASSERT_TRUE(surface->peekPixels(&pixmap));
  EXPECT_EQ(pixmap.getColor(180, 100), SK_ColorGREEN);
  EXPECT_EQ(pixmap.getColor(100, 180), SK_ColorRED);
  EXPECT_EQ(pixmap.getColor(100, 100), SK_ColorWHITE);
  EXPECT_EQ(pixmap.getColor(2, 2), SK_ColorWHITE);
}
