// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkCanvas.h>

#include <cstdint>

#include "format.hh"
#include "gallery_config.hh"
#include "math.hh"
#include "random.hh"
#include "status.hh"

namespace ringkit {

// Size of the rendered sheet, in pixels. Rows are stacked vertically & rings of each row are laid
// out left to right.
Vec2 GallerySize(const GalleryConfig&);

// Cell of the given ring, in canvas coordinates (Y pointing down).
Rect CellRect(const GalleryConfig&, int row, int column);

// Draws a single ring into `cell`, honoring the entry's paint settings & rotation.
void DrawEntry(SkCanvas&, const Shape&, const RingEntry&, Rect cell, float padding);

// Largest width or height of a rendered sheet, in pixels.
constexpr int kMaxGalleryDimension = 16384;
// Largest number of pixels in a rendered sheet.
constexpr int64_t kMaxGalleryPixels = 64 * 1024 * 1024;

// Builds & draws every ring of `config`. Problems with individual entries are logged with ERROR.
// Entries of unknown kinds are left empty.
void DrawGallery(SkCanvas&, const GalleryConfig& config, XorShift32& rng);

// Renders the gallery into a raster surface & saves it at `path`. Files ending with ".webp" are
// encoded as WebP, anything else as PNG.
//
// `status` only reports failures to produce the file: a sheet that exceeds the size limits, a failed
// allocation, an unwritable path or a failed encode.
void RenderGallery(const GalleryConfig& config, XorShift32& rng, StrView path, Status& status);

}  // namespace ringkit
