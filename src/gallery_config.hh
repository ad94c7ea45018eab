// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkColor.h>

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "angle_span.hh"
#include "burst_ring.hh"
#include "color.hh"
#include "format.hh"
#include "random.hh"
#include "ring.hh"
#include "status.hh"

namespace ringkit {

enum class PaintStyle { Fill, Stroke, FillAndStroke };

StrView ToStr(PaintStyle);
// Accepts "fill", "stroke" & "fill_and_stroke".
PaintStyle ParsePaintStyle(StrView, Status&);

// Generator parameters of a single gallery entry.
//
// Every field is optional. Missing fields fall back to the defaults of the ring's constructor (or
// its `Random` constructor when no explicit spans are given).
struct RingParams {
  // Names of the fields that were present, in document order.
  std::vector<Str> fields;

  std::optional<int> tick_count;
  std::optional<int> streak_count;
  std::optional<int> layer_count;
  std::optional<int> frequency;
  std::optional<int> tooth_count;
  std::optional<int> spoke_count;

  std::optional<float> thickness_ratio;
  // Absolute band width of the burst ring, in pixels.
  std::optional<float> thickness;
  std::optional<float> streak_arc;
  std::optional<float> streak_offset;
  std::optional<float> inset_ratio;
  std::optional<float> amplitude_ratio;
  std::optional<float> outer_control_ratio;
  std::optional<float> inner_control_ratio;
  std::optional<float> tooth_depth_ratio;
  std::optional<float> spoke_width_ratio;

  std::optional<bool> clockwise;
  std::optional<bool> uniform_spacing;
  std::optional<bool> include_center_hole;

  std::optional<IntRange> streaks_per_layer;
  std::optional<IntRange> ray_count_range;
  std::optional<IntRange> span_count_range;
  std::optional<IntRange> outer_span_count_range;
  std::optional<IntRange> inner_span_count_range;

  std::optional<Range> span_width_ratio_range;
  std::optional<Range> width_range;
  std::optional<Range> spacing_range;

  std::optional<std::vector<float>> raw_spans;
  std::optional<std::vector<Span>> spans;
  std::optional<std::vector<Span>> outer_spans;
  std::optional<std::vector<Span>> inner_spans;
  std::optional<std::vector<std::vector<Span>>> streaks;
};

// One cell of the gallery, as written in the config.
struct RingEntry {
  // One of the names returned by `RingName`, or "burst".
  Str kind;
  RingParams params;
  SkColor color = color::kBlack;
  // Outline color for `PaintStyle::FillAndStroke`. Defaults to `color`.
  std::optional<SkColor> stroke_color;
  // Band color of the burst ring. Spokes use `color`.
  SkColor background = color::kWhite;
  PaintStyle style = PaintStyle::Fill;
  float stroke_width = 2;
  // Clockwise rotation of the cell contents, in degrees.
  float rotation = 0;
};

struct GalleryRow {
  Str title;
  std::vector<RingEntry> rings;
};

struct GalleryConfig {
  // Width & height of each cell, in pixels.
  float cell_size = 200;
  // Empty space between the cell border and the ring.
  float padding = 8;
  // Gap between neighboring cells & rows.
  float spacing = 12;
  // Seed for the randomized rings. When missing, the rings change on every run.
  std::optional<int64_t> seed;
  SkColor background = color::kWhite;
  std::vector<GalleryRow> rows;
};

using Shape = std::variant<Ring, BurstRing>;

// Construct the generator described by `entry`.
//
// Reports unknown kinds and fields that don't apply to the kind. Returns nullopt only for unknown
// kinds - ignored fields still produce a shape.
std::optional<Shape> BuildShape(const RingEntry& entry, XorShift32& rng, Status& status);

// Parse a gallery config from JSON text.
//
// Problems with individual fields are appended to `status` but don't stop the parsing. Fields that
// parsed correctly are kept in `config`.
void LoadConfigFromString(Str json, GalleryConfig& config, Status& status);

void LoadConfig(StrView path, GalleryConfig& config, Status& status);

// JSON of the sheet that is rendered when no config is given.
extern const char kDefaultConfigJson[];

// Rows of gears, bursts, tech rings, waves & streaks.
GalleryConfig DefaultConfig();

}  // namespace ringkit
