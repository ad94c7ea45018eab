// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "gallery.hh"

#include <include/core/SkImageInfo.h>
#include <include/core/SkPaint.h>
#include <include/core/SkPixmap.h>
#include <include/core/SkStream.h>
#include <include/core/SkSurface.h>
#include <include/encode/SkPngEncoder.h>
#include <include/encode/SkWebpEncoder.h>

#include <algorithm>
#include <cmath>

#include "log.hh"
#include "log_skia.hh"

namespace ringkit {

constexpr bool kDebugGallery = false;

Vec2 GallerySize(const GalleryConfig& config) {
  int columns = 1;
  for (const GalleryRow& row : config.rows) {
    columns = std::max(columns, (int)row.rings.size());
  }
  int rows = std::max(1, (int)config.rows.size());
  float step = config.cell_size + config.spacing;
  return Vec2(config.spacing + columns * step, config.spacing + rows * step);
}

Rect CellRect(const GalleryConfig& config, int row, int column) {
  float step = config.cell_size + config.spacing;
  return Rect::MakeXYWH(config.spacing + column * step, config.spacing + row * step,
                        config.cell_size, config.cell_size);
}

void DrawEntry(SkCanvas& canvas, const Shape& shape, const RingEntry& entry, Rect cell,
               float padding) {
  Rect area = cell.Inset(padding);
  if (area.Width() <= 0 || area.Height() <= 0) {
    return;
  }
  canvas.save();
  if (entry.rotation != 0) {
    Vec2 center = area.Center();
    canvas.rotate(entry.rotation, center.x, center.y);
  }
  if (auto* burst = std::get_if<BurstRing>(&shape)) {
    burst->Draw(canvas, area, entry.background, entry.color);
  } else {
    SkPath path = PathFor(std::get<Ring>(shape), area);
    if constexpr (kDebugGallery) {
      LOG << RingName(std::get<Ring>(shape)) << ": " << path;
    }
    SkPaint paint;
    paint.setAntiAlias(true);
    paint.setColor(entry.color);
    if (entry.style == PaintStyle::Stroke) {
      paint.setStyle(SkPaint::kStroke_Style);
      paint.setStrokeWidth(entry.stroke_width);
    }
    canvas.drawPath(path, paint);
    if (entry.style == PaintStyle::FillAndStroke) {
      paint.setColor(entry.stroke_color.value_or(entry.color));
      paint.setStyle(SkPaint::kStroke_Style);
      paint.setStrokeWidth(entry.stroke_width);
      canvas.drawPath(path, paint);
    }
  }
  canvas.restore();
}

void DrawGallery(SkCanvas& canvas, const GalleryConfig& config, XorShift32& rng) {
  canvas.clear(config.background);
  for (int r = 0; r < config.rows.size(); ++r) {
    const GalleryRow& row = config.rows[r];
    LOG << "Drawing \"" << row.title << "\" (" << row.rings.size() << " rings)";
    LOG_Indent();
    for (int c = 0; c < row.rings.size(); ++c) {
      const RingEntry& entry = row.rings[c];
      Status entry_status;
      auto shape = BuildShape(entry, rng, entry_status);
      if (!OK(entry_status)) {
        ERROR << f("{} #{}: {}", row.title, c + 1, entry_status.ToStr());
      }
      if (!shape) {
        continue;
      }
      DrawEntry(canvas, *shape, entry, CellRect(config, r, c), config.padding);
    }
    LOG_Unindent();
  }
}

static bool EndsWith(StrView str, StrView suffix) {
  return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
}

void RenderGallery(const GalleryConfig& config, XorShift32& rng, StrView path, Status& status) {
  Vec2 size = GallerySize(config);
  // Negated comparisons also reject NaN.
  if (!(size.width >= 1 && size.width <= kMaxGalleryDimension && size.height >= 1 &&
        size.height <= kMaxGalleryDimension)) {
    AppendErrorMessage(status) +=
        f("Gallery of {}x{} pixels doesn't fit in the {}x{} limit", size.width, size.height,
          kMaxGalleryDimension, kMaxGalleryDimension);
    return;
  }
  int width = std::ceil(size.width);
  int height = std::ceil(size.height);
  if ((int64_t)width * height > kMaxGalleryPixels) {
    AppendErrorMessage(status) += f("Gallery of {}x{} pixels exceeds the limit of {} pixels",
                                    width, height, kMaxGalleryPixels);
    return;
  }
  auto surface = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(width, height));
  if (surface == nullptr) {
    AppendErrorMessage(status) += f("Couldn't allocate a {}x{} raster surface", width, height);
    return;
  }
  DrawGallery(*surface->getCanvas(), config, rng);

  SkPixmap pixmap;
  if (!surface->peekPixels(&pixmap)) {
    AppendErrorMessage(status) += "Couldn't read the pixels of the raster surface";
    return;
  }
  Str path_str(path);
  SkFILEWStream stream(path_str.c_str());
  if (!stream.isValid()) {
    AppendErrorMessage(status) += f("Couldn't open \"{}\" for writing", path);
    return;
  }
  bool encoded;
  if (EndsWith(path, ".webp")) {
    SkWebpEncoder::Options options;
    options.fQuality = 95;
    encoded = SkWebpEncoder::Encode(&stream, pixmap, options);
  } else {
    encoded = SkPngEncoder::Encode(&stream, pixmap, SkPngEncoder::Options());
  }
  if (!encoded) {
    AppendErrorMessage(status) += f("Couldn't encode \"{}\"", path);
    return;
  }
  stream.flush();
  LOG << "Saved " << width << "x" << height << " gallery to " << path;
}

}  // namespace ringkit
