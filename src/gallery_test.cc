// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "gallery.hh"

#include <include/core/SkImageInfo.h>
#include <include/core/SkPixmap.h>
#include <include/core/SkSurface.h>

#include <cstdio>
#include <fstream>
#include <iterator>

#include "gtest.hh"
#include "log.hh"
#include "test_base.hh"

using namespace ringkit;

static GalleryConfig SingleCellConfig(RingEntry entry) {
  GalleryConfig config;
  config.cell_size = 200;
  config.padding = 0;
  config.spacing = 0;
  config.rows.push_back({.title = "Row", .rings = {std::move(entry)}});
  return config;
}

static RingEntry Entry(Str kind, SkColor color) {
  RingEntry entry;
  entry.kind = std::move(kind);
  entry.color = color;
  return entry;
}

TEST(GalleryTest, Layout) {
  GalleryConfig config;
  config.cell_size = 100;
  config.spacing = 10;
  config.rows.push_back({.title = "A", .rings = {Entry("gear", 0), Entry("gear", 0), Entry("gear", 0)}});
  config.rows.push_back({.title = "B", .rings = {Entry("wave", 0)}});
  Vec2 size = GallerySize(config);
  EXPECT_EQ(size.width, 340);
  EXPECT_EQ(size.height, 230);
  EXPECT_EQ(CellRect(config, 0, 0), Rect(10, 10, 110, 110));
  EXPECT_EQ(CellRect(config, 1, 2), Rect(230, 120, 330, 220));
}

TEST(GalleryTest, EmptyConfigHasOneCell) {
  GalleryConfig config;
  config.cell_size = 100;
  config.spacing = 10;
  Vec2 size = GallerySize(config);
  EXPECT_EQ(size.width, 120);
  EXPECT_EQ(size.height, 120);
}

class GalleryDrawTest : public testing::Test {
 protected:
  void SetUp() override {
    surface = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(200, 200));
    ASSERT_NE(surface, nullptr);
  }

  SkColor Pixel(int x, int y) {
    SkPixmap pixmap;
    EXPECT_TRUE(surface->peekPixels(&pixmap));
    return pixmap.getColor(x, y);
  }

  sk_sp<SkSurface> surface;
};

TEST_F(GalleryDrawTest, DrawsGear) {
  GalleryConfig config = SingleCellConfig(Entry("gear", SK_ColorRED));
  XorShift32 rng(1);
  CapturedLogs logs;
  DrawGallery(*surface->getCanvas(), config, rng);
  EXPECT_THAT(logs.levels, testing::Not(testing::Contains(LogLevel::Error)));
  EXPECT_EQ(Pixel(175, 100), SK_ColorRED);
  EXPECT_EQ(Pixel(100, 100), SK_ColorWHITE);
  EXPECT_EQ(Pixel(2, 2), SK_ColorWHITE);
}

TEST_F(GalleryDrawTest, BackgroundColor) {
  GalleryConfig config = SingleCellConfig(Entry("gear", SK_ColorRED));
  config.background = SK_ColorBLUE;
  XorShift32 rng(1);
  DrawGallery(*surface->getCanvas(), config, rng);
  EXPECT_EQ(Pixel(2, 2), SK_ColorBLUE);
  EXPECT_EQ(Pixel(100, 100), SK_ColorBLUE);
}

TEST_F(GalleryDrawTest, UnknownKindIsLoggedAndSkipped) {
  GalleryConfig config = SingleCellConfig(Entry("spiral", SK_ColorRED));
  XorShift32 rng(1);
  CapturedLogs logs;
  DrawGallery(*surface->getCanvas(), config, rng);
  std::vector<Str> errors;
  for (int i = 0; i < logs.lines.size(); ++i) {
    if (logs.levels[i] == LogLevel::Error) {
      errors.push_back(logs.lines[i]);
    }
  }
  ASSERT_EQ(errors.size(), 1);
  EXPECT_THAT(errors[0], testing::HasSubstr("Row #1: Unknown ring kind \"spiral\""));
  EXPECT_EQ(Pixel(175, 100), SK_ColorWHITE);
}

TEST_F(GalleryDrawTest, BurstUsesBothColors) {
  RingEntry entry = Entry("burst", SK_ColorGREEN);
  entry.background = SK_ColorBLUE;
  Shape shape = BurstRing(40, {{.angle = 0, .width = 10}});
  SkCanvas& canvas = *surface->getCanvas();
  canvas.clear(SK_ColorWHITE);
  DrawEntry(canvas, shape, entry, Rect::MakeCornerZero(200, 200), 0);
  EXPECT_EQ(Pixel(180, 100), SK_ColorGREEN);
  EXPECT_EQ(Pixel(100, 180), SK_ColorBLUE);
  EXPECT_EQ(Pixel(100, 100), SK_ColorWHITE);
}

TEST_F(GalleryDrawTest, RotationTurnsClockwise) {
  RingEntry entry = Entry("burst", SK_ColorGREEN);
  entry.background = SK_ColorBLUE;
  entry.rotation = 90;
  Shape shape = BurstRing(40, {{.angle = 0, .width = 10}});
  SkCanvas& canvas = *surface->getCanvas();
  canvas.clear(SK_ColorWHITE);
  DrawEntry(canvas, shape, entry, Rect::MakeCornerZero(200, 200), 0);
  EXPECT_EQ(Pixel(100, 180), SK_ColorGREEN);
  EXPECT_EQ(Pixel(180, 100), SK_ColorBLUE);
}

TEST_F(GalleryDrawTest, PaddingShrinksRing) {
  RingEntry entry = Entry("gear", SK_ColorRED);
  entry.params.spoke_count = 0;
  entry.params.include_center_hole = false;
  Shape shape = Ring(GearRing(24, 0.8f, 0, 0.7f, false));
  SkCanvas& canvas = *surface->getCanvas();
  canvas.clear(SK_ColorWHITE);
  DrawEntry(canvas, shape, entry, Rect::MakeCornerZero(200, 200), 50);
  EXPECT_EQ(Pixel(100, 100), SK_ColorRED);
  EXPECT_EQ(Pixel(170, 100), SK_ColorWHITE);
}

TEST_F(GalleryDrawTest, StrokeLeavesInteriorEmpty) {
  RingEntry entry = Entry("gear", SK_ColorRED);
  entry.style = PaintStyle::Stroke;
  entry.stroke_width = 2;
  Shape shape = Ring(GearRing(24, 0.8f, 0, 0.7f, false));
  SkCanvas& canvas = *surface->getCanvas();
  canvas.clear(SK_ColorWHITE);
  DrawEntry(canvas, shape, entry, Rect::MakeCornerZero(200, 200), 0);
  EXPECT_EQ(Pixel(100, 100), SK_ColorWHITE);
  EXPECT_EQ(Pixel(150, 100), SK_ColorWHITE);
}

TEST_F(GalleryDrawTest, FillAndStrokeUsesStrokeColor) {
  RingEntry entry = Entry("gear", SK_ColorRED);
  entry.style = PaintStyle::FillAndStroke;
  entry.stroke_color = SK_ColorBLACK;
  entry.stroke_width = 20;
  Shape shape = Ring(GearRing(24, 0.8f, 0, 0.7f, false));
  SkCanvas& canvas = *surface->getCanvas();
  canvas.clear(SK_ColorWHITE);
  DrawEntry(canvas, shape, entry, Rect::MakeCornerZero(200, 200), 0);
  EXPECT_EQ(Pixel(100, 100), SK_ColorRED);
  // Bottom of the tooth at angle 0 is 80px from the center.
  EXPECT_EQ(Pixel(180, 100), SK_ColorBLACK);
}

TEST(GalleryRenderTest, WritesPng) {
  GalleryConfig config = SingleCellConfig(Entry("wave", SK_ColorBLUE));
  config.cell_size = 64;
  Str path = testing::TempDir() + "gallery_test.png";
  XorShift32 rng(1);
  Status status;
  RenderGallery(config, rng, path, status);
  ASSERT_TRUE(OK(status)) << status.error;
  std::ifstream in(path, std::ios::binary);
  ASSERT_TRUE(in.good());
  Str header(8, '\0');
  in.read(header.data(), header.size());
  EXPECT_EQ(header, Str("\x89PNG\r\n\x1a\n", 8));
}

TEST(GalleryRenderTest, EntryProblemsDontFailTheRender) {
  RingEntry entry = Entry("gauge", SK_ColorBLACK);
  entry.params.tooth_count = 12;
  entry.params.fields = {"tooth_count"};
  GalleryConfig config = SingleCellConfig(entry);
  config.cell_size = 64;
  Str path = testing::TempDir() + "gallery_test_entry_problem.png";
  XorShift32 rng(1);
  Status status;
  CapturedLogs logs;
  RenderGallery(config, rng, path, status);
  EXPECT_TRUE(OK(status)) << status.error;
  EXPECT_TRUE(std::ifstream(path, std::ios::binary).good());
  bool logged = false;
  for (int i = 0; i < logs.lines.size(); ++i) {
    logged |= logs.levels[i] == LogLevel::Error &&
              logs.lines[i].find("doesn't apply to gauge rings") != Str::npos;
  }
  EXPECT_TRUE(logged);
}

TEST(GalleryRenderTest, OversizedGalleryIsRejected) {
  GalleryConfig config = SingleCellConfig(Entry("wave", SK_ColorBLUE));
  config.cell_size = 1e9;
  Str path = testing::TempDir() + "gallery_test_oversized.png";
  std::remove(path.c_str());
  XorShift32 rng(1);
  Status status;
  RenderGallery(config, rng, path, status);
  EXPECT_THAT(status.error, testing::HasSubstr("doesn't fit in the 16384x16384 limit"));
  EXPECT_FALSE(std::ifstream(path).good());
}

TEST(GalleryRenderTest, TooManyPixelsIsRejected) {
  // Each side fits but the area doesn't.
  GalleryConfig config = SingleCellConfig(Entry("wave", SK_ColorBLUE));
  config.cell_size = 9000;
  XorShift32 rng(1);
  Status status;
  RenderGallery(config, rng, testing::TempDir() + "gallery_test_many_pixels.png", status);
  EXPECT_THAT(status.error, testing::HasSubstr("exceeds the limit of 67108864 pixels"));
}

TEST(GalleryRenderTest, UnwritablePath) {
  GalleryConfig config = SingleCellConfig(Entry("wave", SK_ColorBLUE));
  config.cell_size = 16;
  XorShift32 rng(1);
  Status status;
  RenderGallery(config, rng, "/nonexistent/dir/out.png", status);
  EXPECT_EQ(status.error, "Couldn't open \"/nonexistent/dir/out.png\" for writing");
}
