// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "tech_ring.hh"

#include "gtest.hh"
#include "test_base.hh"

using namespace ringkit;
using ::testing::ElementsAre;

TEST(TechRingTest, DegenerateSpanListsDrawNothing) {
  Rect rect = Rect::MakeCornerZero(100, 100);
  EXPECT_TRUE(TechRing(0.1f, std::vector<float>{}).PathIn(rect).isEmpty());
  EXPECT_TRUE(TechRing(0.1f, std::vector<float>{0}).PathIn(rect).isEmpty());
  EXPECT_TRUE(TechRing(0.1f, std::vector<float>{0, 1, 2}).PathIn(rect).isEmpty());
}

TEST(TechRingTest, StrictModeReportsOddNotchLists) {
  Rect rect = Rect::MakeCornerZero(100, 100);
  CapturedLogs logs;
  EXPECT_TRUE(TechRing(0.1f, std::vector<float>{0, 1, 2}).PathIn(rect).isEmpty());
  EXPECT_TRUE(logs.lines.empty());

  strict_diagnostics = true;
  bool empty = TechRing(0.1f, std::vector<float>{0, 1, 2}).PathIn(rect).isEmpty();
  strict_diagnostics = false;
  EXPECT_TRUE(empty);
  ASSERT_EQ(logs.lines.size(), 1);
  EXPECT_EQ(logs.levels[0], LogLevel::Error);
  EXPECT_THAT(logs.lines[0], ::testing::HasSubstr("even number of angles"));
  EXPECT_THAT(logs.lines[0], ::testing::HasSubstr("got 3"));
}

TEST(TechRingTest, TransitionAngleKeepsWallLength) {
  EXPECT_NEAR(TransitionAngle(100, 10), acosf(0.995f), 1e-6);
  float t = TransitionAngle(100, 10);
  Vec2 a = PointOnCircle(Vec2(0, 0), 100, 0);
  Vec2 b = PointOnCircle(Vec2(0, 0), 100, t);
  EXPECT_NEAR(Distance(a, b), 10, 1e-3);
  EXPECT_FLOAT_EQ(TransitionAngle(100, 0), 0);
}

TEST(TechRingTest, SingleNotch) {
  Rect rect = Rect::MakeCornerZero(200, 200);
  SkPath path = TechRing(0.1f, std::vector<float>{0, kPi}).PathIn(rect);
  auto contours = Contours(path);
  ASSERT_EQ(contours.size(), 1);
  EXPECT_TRUE(contours[0].closed);
  for (Vec2 p : contours[0].points) {
    float d = Distance(p, rect.Center());
    EXPECT_TRUE(fabsf(d - 100) < 1e-3 || fabsf(d - 90) < 1e-3) << p.ToStr();
  }
  // The notch covers angles 0..π, which point towards +Y.
  EXPECT_FALSE(path.contains(100, 195));
  EXPECT_TRUE(path.contains(100, 5));
  EXPECT_TRUE(path.contains(100, 185));
  EXPECT_TRUE(path.contains(100, 100));
}

TEST(TechRingTest, SpansAreFlattened) {
  EXPECT_THAT(FlattenSpans({{1, 2}, {3, 4}}), ElementsAre(1, 2, 3, 4));
  TechRing ring(0.2f, std::vector<Span>{{0.5f, 1}});
  EXPECT_THAT(ring.spans, ElementsAre(0.5f, 1));
}

TEST(TechRingTest, InsetRatioIsClamped) {
  EXPECT_FLOAT_EQ(TechRing(2.f, std::vector<float>{}).inset_ratio, 1);
  EXPECT_FLOAT_EQ(TechRing(-1.f, std::vector<float>{}).inset_ratio, 0);
}

TEST(TechRingTest, RandomNotchesAreOrdered) {
  for (uint64_t seed = 0; seed < 10; ++seed) {
    XorShift32 rng = XorShift32::MakeFromSeed(seed);
    auto ring = TechRing::Random(rng);
    ASSERT_EQ(ring.spans.size() % 2, 0);
    ASSERT_GE(ring.spans.size(), 4);
    ASSERT_LE(ring.spans.size(), 10);
    int n = ring.spans.size() / 2;
    float slot = kTau / n;
    for (int i = 0; i < ring.spans.size(); i += 2) {
      float width = ring.spans[i + 1] - ring.spans[i];
      EXPECT_GE(width, slot * 0.25f - 1e-5);
      EXPECT_LE(width, slot * 0.75f + 1e-5);
      if (i + 2 < ring.spans.size()) {
        EXPECT_LT(ring.spans[i + 1], ring.spans[i + 2]);
      }
    }
    EXPECT_FALSE(ring.PathIn(Rect::MakeCornerZero(100, 100)).isEmpty());
  }
}

TEST(TechRingTest, RandomNotchCountIsCapped) {
  XorShift32 rng(9);
  auto notches = RandomNotches(rng, {2000000000, 2000000000}, {0.25f, 0.75f});
  EXPECT_EQ(notches.size(), kMaxNotchCount * 2);
}

TEST(TechRingTest, SeededConstructionIsReproducible) {
  XorShift32 a = XorShift32::MakeFromSeed(5);
  XorShift32 b = XorShift32::MakeFromSeed(5);
  EXPECT_EQ(TechRing::Random(a).spans, TechRing::Random(b).spans);
  EXPECT_EQ(HollowTechRing::Random(a).inner_spans, HollowTechRing::Random(b).inner_spans);
}

TEST(HollowTechRingTest, InnerRect) {
  HollowTechRing ring(0.1f, 0.25f, std::vector<float>{}, std::vector<float>{});
  EXPECT_EQ(ring.InnerRect(Rect::MakeCornerZero(200, 200)), Rect(15, 15, 185, 185));
  EXPECT_EQ(ring.InnerRect(Rect::MakeCornerZero(400, 200)), Rect(115, 15, 285, 185));
}

TEST(HollowTechRingTest, InnerRingIsCutOut) {
  HollowTechRing ring(0.1f, 0.25f, std::vector<float>{0, 0.5f},
                      std::vector<float>{kPi, kPi + 0.5f});
  SkPath path = ring.PathIn(Rect::MakeCornerZero(200, 200));
  EXPECT_TRUE(path.contains(100, 192));
  EXPECT_FALSE(path.contains(100, 180));
  EXPECT_FALSE(path.contains(100, 100));
  EXPECT_FALSE(path.contains(100, 205));
}

TEST(HollowTechRingTest, ThicknessIsClamped) {
  HollowTechRing ring(0.1f, 3.f, std::vector<float>{}, std::vector<float>{});
  EXPECT_FLOAT_EQ(ring.thickness_ratio, 1);
}

TEST(HollowTechRingTest, RandomNotchCounts) {
  XorShift32 rng = XorShift32::MakeFromSeed(3);
  auto ring = HollowTechRing::Random(rng, 0.1f, 0.25f, {3, 3}, {2, 2});
  EXPECT_EQ(ring.outer_spans.size(), 6);
  EXPECT_EQ(ring.inner_spans.size(), 4);
}
