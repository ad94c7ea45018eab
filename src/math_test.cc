// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "math.hh"

#include "gtest.hh"

using namespace ringkit;

TEST(RectTest, CenteredSquareOfWideRect) {
  Rect square = Rect(0, 0, 200, 100).CenteredSquare();
  EXPECT_EQ(square, Rect(50, 0, 150, 100));
}

TEST(RectTest, CenteredSquareOfTallRect) {
  Rect square = CenteredSquare(Rect::MakeXYWH(10, 20, 40, 100));
  EXPECT_EQ(square, Rect(10, 50, 50, 90));
}

TEST(RectTest, CenteredSquareIsIdempotent) {
  for (Rect rect : {Rect(0, 0, 200, 100), Rect(-5, 3, 7, 100), Rect(1, 1, 1, 1)}) {
    Rect square = rect.CenteredSquare();
    EXPECT_EQ(square.CenteredSquare(), square) << rect.ToStr();
    EXPECT_FLOAT_EQ(square.Width(), square.Height());
    EXPECT_FLOAT_EQ(square.CenterX(), rect.CenterX());
    EXPECT_FLOAT_EQ(square.CenterY(), rect.CenterY());
  }
}

TEST(RectTest, InsetIsInverseOfOutset) {
  Rect rect = Rect::MakeXYWH(0, -5, 10, 20);
  EXPECT_EQ(rect.Inset(2), Rect(2, -3, 8, 13));
  EXPECT_EQ(rect.Inset(2).Outset(2), rect);
}

TEST(RectTest, MakeXYWHStartsAtTheTopLeftOnScreen) {
  Rect rect = Rect::MakeXYWH(10, 20, 30, 40);
  SkRect sk = rect;
  EXPECT_FLOAT_EQ(sk.fLeft, 10);
  EXPECT_FLOAT_EQ(sk.fTop, 20);
  EXPECT_FLOAT_EQ(sk.fRight, 40);
  EXPECT_FLOAT_EQ(sk.fBottom, 60);
  EXPECT_FLOAT_EQ(rect.bottom, sk.fTop);
  EXPECT_FLOAT_EQ(rect.top, sk.fBottom);
  EXPECT_EQ(Rect::MakeCornerZero(30, 40), Rect::MakeXYWH(0, 0, 30, 40));
}

TEST(Vec2Test, PointOnCircle) {
  Vec2 p = PointOnCircle(Vec2(10, 10), 5, kPi / 2);
  EXPECT_NEAR(p.x, 10, 1e-5);
  EXPECT_NEAR(p.y, 15, 1e-5);
  p = PointOnCircle(Vec2(0, 0), 2, kPi);
  EXPECT_NEAR(p.x, -2, 1e-5);
  EXPECT_NEAR(p.y, 0, 1e-5);
}

TEST(Vec2Test, Arithmetic) {
  Vec2 a(3, 4);
  EXPECT_FLOAT_EQ(Length(a), 5);
  EXPECT_EQ(a * 2 - Vec2(1, 1), Vec2(5, 7));
  EXPECT_EQ(a.ToStr(), "Vec2(3, 4)");
}
