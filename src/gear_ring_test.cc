// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "gear_ring.hh"

#include "gtest.hh"
#include "test_base.hh"

using namespace ringkit;

TEST(GearRingTest, OutlineHasFourVerticesPerTooth) {
  Rect rect = Rect::MakeCornerZero(200, 200);
  for (int teeth : {2, 7, 24, 64}) {
    GearRing gear(teeth);
    SkPath outline = gear.Outline(rect);
    EXPECT_EQ(outline.countPoints(), 4 * teeth) << teeth << " teeth";
    auto contours = Contours(outline);
    ASSERT_EQ(contours.size(), 1) << teeth << " teeth";
    EXPECT_TRUE(contours[0].closed);
    EXPECT_EQ(contours[0].points.size(), 4 * teeth);
  }
}

TEST(GearRingTest, TeethAlternateBetweenRadii) {
  Rect rect = Rect::MakeCornerZero(200, 200);
  GearRing gear(12, 0.8f);
  auto contours = Contours(gear.Outline(rect));
  ASSERT_EQ(contours.size(), 1);
  auto& points = contours[0].points;
  for (int i = 0; i < points.size(); ++i) {
    bool outer = i % 4 == 2 || i % 4 == 3;
    EXPECT_NEAR(Distance(points[i], rect.Center()), outer ? 100 : 80, 1e-3) << "vertex " << i;
  }
}

TEST(GearRingTest, ParametersAreClamped) {
  GearRing low(1, 0.1f, -3, 0.f, false);
  EXPECT_EQ(low.tooth_count, 2);
  EXPECT_FLOAT_EQ(low.tooth_depth_ratio, 0.65f);
  EXPECT_EQ(low.spoke_count, 0);
  EXPECT_FLOAT_EQ(low.spoke_width_ratio, 0.2f);
  GearRing high(100, 2.f, 20, 1.f, true);
  EXPECT_EQ(high.tooth_count, 64);
  EXPECT_FLOAT_EQ(high.tooth_depth_ratio, 1);
  EXPECT_EQ(high.spoke_count, 12);
  EXPECT_FLOAT_EQ(high.spoke_width_ratio, 0.9f);
}

TEST(GearRingTest, SpokesAndHoleAreCutOut) {
  SkPath path = GearRing().PathIn(Rect::MakeCornerZero(200, 200));
  Vec2 center(100, 100);
  // Center hole.
  EXPECT_FALSE(path.contains(center.x, center.y));
  // Hub between the hole & the spoke slots.
  Vec2 hub = PointOnCircle(center, 15, 0.366f);
  EXPECT_TRUE(path.contains(hub.x, hub.y));
  // Middle of the first spoke slot.
  Vec2 slot = PointOnCircle(center, 50, 0.366f);
  EXPECT_FALSE(path.contains(slot.x, slot.y));
  // Rim between the slots & the teeth.
  for (float angle : {0.f, 1.f, 2.f, 4.f}) {
    Vec2 rim = PointOnCircle(center, 75, angle);
    EXPECT_TRUE(path.contains(rim.x, rim.y)) << angle;
  }
  EXPECT_FALSE(path.contains(100, 205));
}

TEST(GearRingTest, SolidGearIsTheOutline) {
  Rect rect = Rect::MakeCornerZero(200, 200);
  GearRing gear(24, 0.8f, 0, 0.7f, false);
  SkPath path = gear.PathIn(rect);
  EXPECT_EQ(path.countPoints(), 4 * 24);
  EXPECT_EQ(path.getFillType(), SkPathFillType::kEvenOdd);
  EXPECT_TRUE(path.contains(100, 100));
}

TEST(GearRingTest, SingleSpokeOnlyCutsTheHole) {
  SkPath path = GearRing(24, 0.8f, 1, 0.7f, true).PathIn(Rect::MakeCornerZero(200, 200));
  EXPECT_FALSE(path.contains(100, 100));
  EXPECT_TRUE(path.contains(150, 100));
  EXPECT_TRUE(path.contains(100, 115));
}
