// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "gallery_config.hh"

#include <include/core/SkData.h>

#include <algorithm>
#include <cstddef>
#include <initializer_list>

#include "deserializer.hh"
#include "log.hh"

namespace ringkit {

StrView ToStr(PaintStyle style) {
  switch (style) {
    case PaintStyle::Fill:
      return "fill";
    case PaintStyle::Stroke:
      return "stroke";
    case PaintStyle::FillAndStroke:
      return "fill_and_stroke";
  }
  return "fill";
}

PaintStyle ParsePaintStyle(StrView str, Status& status) {
  for (auto style : {PaintStyle::Fill, PaintStyle::Stroke, PaintStyle::FillAndStroke}) {
    if (str == ToStr(style)) {
      return style;
    }
  }
  AppendErrorMessage(status) += f("Unknown paint style \"{}\"", str);
  return PaintStyle::Fill;
}

// Value readers. Each one consumes exactly one JSON value.

static void Get(Deserializer& d, int& value, Status& status) { d.Get(value, status); }
static void Get(Deserializer& d, float& value, Status& status) { d.Get(value, status); }
static void Get(Deserializer& d, bool& value, Status& status) { d.Get(value, status); }

static void Get(Deserializer& d, SkColor& value, Status& status) {
  Str hex;
  d.Get(hex, status);
  if (!OK(status)) {
    return;
  }
  SkColor parsed = ParseHexColor(hex, status);
  if (OK(status)) {
    value = parsed;
  }
}

// Reads a two-element array.
template <typename T>
static void GetPair(Deserializer& d, T& first, T& second, Status& status) {
  int n = 0;
  for (int i : ArrayView(d, status)) {
    if (i == 0) {
      Get(d, first, status);
    } else if (i == 1) {
      Get(d, second, status);
    } else {
      d.Skip();
    }
    n = i + 1;
  }
  if (OK(status) && n != 2) {
    AppendErrorMessage(status) += f("{}: expected 2 elements but got {}", d.DebugPath(), n);
  }
}

static void Get(Deserializer& d, Range& value, Status& status) {
  GetPair(d, value.min, value.max, status);
}

static void Get(Deserializer& d, IntRange& value, Status& status) {
  GetPair(d, value.min, value.max, status);
}

static void Get(Deserializer& d, Span& value, Status& status) {
  GetPair(d, value.start, value.end, status);
}

template <typename T>
static void Get(Deserializer& d, std::vector<T>& value, Status& status) {
  value.clear();
  for (int i : ArrayView(d, status)) {
    T element;
    Get(d, element, status);
    if (OK(status)) {
      value.push_back(std::move(element));
    }
  }
}

template <typename T>
struct Field {
  StrView name;
  std::optional<T> RingParams::* member;
};

// clang-format off
static const Field<int> kIntFields[] = {
    {"tick_count", &RingParams::tick_count},
    {"streak_count", &RingParams::streak_count},
    {"layer_count", &RingParams::layer_count},
    {"frequency", &RingParams::frequency},
    {"tooth_count", &RingParams::tooth_count},
    {"spoke_count", &RingParams::spoke_count},
};
static const Field<float> kFloatFields[] = {
    {"thickness_ratio", &RingParams::thickness_ratio},
    {"thickness", &RingParams::thickness},
    {"streak_arc", &RingParams::streak_arc},
    {"streak_offset", &RingParams::streak_offset},
    {"inset_ratio", &RingParams::inset_ratio},
    {"amplitude_ratio", &RingParams::amplitude_ratio},
    {"outer_control_ratio", &RingParams::outer_control_ratio},
    {"inner_control_ratio", &RingParams::inner_control_ratio},
    {"tooth_depth_ratio", &RingParams::tooth_depth_ratio},
    {"spoke_width_ratio", &RingParams::spoke_width_ratio},
};
static const Field<bool> kBoolFields[] = {
    {"clockwise", &RingParams::clockwise},
    {"uniform_spacing", &RingParams::uniform_spacing},
    {"include_center_hole", &RingParams::include_center_hole},
};
static const Field<IntRange> kIntRangeFields[] = {
    {"streaks_per_layer", &RingParams::streaks_per_layer},
    {"ray_count_range", &RingParams::ray_count_range},
    {"span_count_range", &RingParams::span_count_range},
    {"outer_span_count_range", &RingParams::outer_span_count_range},
    {"inner_span_count_range", &RingParams::inner_span_count_range},
};
static const Field<Range> kRangeFields[] = {
    {"span_width_ratio_range", &RingParams::span_width_ratio_range},
    {"width_range", &RingParams::width_range},
    {"spacing_range", &RingParams::spacing_range},
};
static const Field<std::vector<float>> kFloatListFields[] = {
    {"raw_spans", &RingParams::raw_spans},
};
static const Field<std::vector<Span>> kSpanListFields[] = {
    {"spans", &RingParams::spans},
    {"outer_spans", &RingParams::outer_spans},
    {"inner_spans", &RingParams::inner_spans},
};
static const Field<std::vector<std::vector<Span>>> kLayerListFields[] = {
    {"streaks", &RingParams::streaks},
};
// clang-format on

// Returns true if `key` names one of `fields`. Its value is then read into `params`.
template <typename T, size_t N>
static bool GetField(Deserializer& d, StrView key, const Field<T> (&fields)[N], RingParams& params,
                     Status& status) {
  for (const Field<T>& field : fields) {
    if (field.name != key) {
      continue;
    }
    T value{};
    Get(d, value, status);
    if (OK(status)) {
      params.*field.member = std::move(value);
      params.fields.emplace_back(key);
    }
    return true;
  }
  return false;
}

static bool GetParam(Deserializer& d, StrView key, RingParams& params, Status& status) {
  return GetField(d, key, kIntFields, params, status) ||
         GetField(d, key, kFloatFields, params, status) ||
         GetField(d, key, kBoolFields, params, status) ||
         GetField(d, key, kIntRangeFields, params, status) ||
         GetField(d, key, kRangeFields, params, status) ||
         GetField(d, key, kFloatListFields, params, status) ||
         GetField(d, key, kSpanListFields, params, status) ||
         GetField(d, key, kLayerListFields, params, status);
}

static void Get(Deserializer& d, RingEntry& entry, Status& status) {
  for (auto& key : ObjectView(d, status)) {
    if (key == "kind") {
      d.Get(entry.kind, status);
    } else if (key == "color") {
      Get(d, entry.color, status);
    } else if (key == "stroke_color") {
      SkColor stroke_color;
      Get(d, stroke_color, status);
      if (OK(status)) {
        entry.stroke_color = stroke_color;
      }
    } else if (key == "background") {
      Get(d, entry.background, status);
    } else if (key == "style") {
      Str style;
      d.Get(style, status);
      if (OK(status)) {
        entry.style = ParsePaintStyle(style, status);
      }
    } else if (key == "stroke_width") {
      d.Get(entry.stroke_width, status);
    } else if (key == "rotation") {
      d.Get(entry.rotation, status);
    } else {
      // Values that aren't consumed here are reported by ObjectView as unknown fields.
      GetParam(d, key, entry.params, status);
    }
  }
  if (OK(status) && entry.kind.empty()) {
    AppendErrorMessage(status) += f("{}: ring is missing its \"kind\"", d.DebugPath());
  }
}

static void Get(Deserializer& d, GalleryRow& row, Status& status) {
  for (auto& key : ObjectView(d, status)) {
    if (key == "title") {
      d.Get(row.title, status);
    } else if (key == "rings") {
      for (int i : ArrayView(d, status)) {
        RingEntry entry;
        Get(d, entry, status);
        // Entries with errors are still kept. Their valid fields are used & the rest falls back to
        // defaults.
        if (!entry.kind.empty()) {
          row.rings.push_back(std::move(entry));
        }
      }
    }
  }
}

void LoadConfigFromString(Str json, GalleryConfig& config, Status& status) {
  rapidjson::InsituStringStream stream(json.data());
  Deserializer d(stream);
  for (auto& key : ObjectView(d, status)) {
    if (key == "cell_size") {
      d.Get(config.cell_size, status);
      if (OK(status) && config.cell_size <= 0) {
        AppendErrorMessage(status) += f("cell_size must be positive, got {}", config.cell_size);
        config.cell_size = GalleryConfig().cell_size;
      }
    } else if (key == "padding") {
      d.Get(config.padding, status);
    } else if (key == "spacing") {
      d.Get(config.spacing, status);
    } else if (key == "seed") {
      int64_t seed;
      d.Get(seed, status);
      if (OK(status)) {
        config.seed = seed;
      }
    } else if (key == "background") {
      Get(d, config.background, status);
    } else if (key == "rows") {
      for (int i : ArrayView(d, status)) {
        GalleryRow row;
        Get(d, row, status);
        config.rows.push_back(std::move(row));
      }
    }
  }
}

void LoadConfig(StrView path, GalleryConfig& config, Status& status) {
  Str path_str(path);
  sk_sp<SkData> data = SkData::MakeFromFileName(path_str.c_str());
  if (data == nullptr) {
    AppendErrorMessage(status) += f("Couldn't read \"{}\"", path);
    return;
  }
  Str json((const char*)data->data(), data->size());
  LoadConfigFromString(std::move(json), config, status);
  if (!OK(status)) {
    status.error = f("In \"{}\": {}", path, status.error);
  }
}

// Reports fields of `params` that the ring of the given `kind` doesn't use.
static void CheckFields(StrView kind, const RingParams& params,
                        std::initializer_list<StrView> allowed, Status& status) {
  for (const Str& field : params.fields) {
    if (std::find(allowed.begin(), allowed.end(), field) == allowed.end()) {
      AppendErrorMessage(status) += f("Field \"{}\" doesn't apply to {} rings", field, kind);
    }
  }
}

// Reports counts above what the generator draws. The generator clamps them.
static void CheckMax(StrView field, const std::optional<int>& value, int max, Status& status) {
  if (value && *value > max) {
    AppendErrorMessage(status) +=
        f("Field \"{}\" is {} but at most {} is drawn", field, *value, max);
  }
}

static void CheckMax(StrView field, const std::optional<IntRange>& value, int max,
                     Status& status) {
  if (value && std::max(value->min, value->max) > max) {
    AppendErrorMessage(status) +=
        f("Field \"{}\" is {} but at most {} is drawn", field, value->ToStr(), max);
  }
}

std::optional<Shape> BuildShape(const RingEntry& entry, XorShift32& rng, Status& status) {
  const RingParams& p = entry.params;
  const Str& kind = entry.kind;
  if (kind == "gauge") {
    CheckFields(kind, p, {"tick_count", "thickness_ratio"}, status);
    CheckMax("tick_count", p.tick_count, kMaxTickCount, status);
    GaugeRing defaults;
    return GaugeRing(p.tick_count.value_or(defaults.tick_count),
                     p.thickness_ratio.value_or(defaults.thickness_ratio));
  }
  if (kind == "offset_streak") {
    CheckFields(kind, p,
                {"thickness_ratio", "streak_count", "streak_arc", "streak_offset", "clockwise"},
                status);
    CheckMax("streak_count", p.streak_count, kMaxStreakCount, status);
    OffsetStreakRing defaults;
    return OffsetStreakRing(p.thickness_ratio.value_or(defaults.thickness_ratio),
                            p.streak_count.value_or(defaults.streak_count),
                            p.streak_arc.value_or(defaults.streak_arc),
                            p.streak_offset.value_or(defaults.streak_offset),
                            p.clockwise.value_or(defaults.clockwise));
  }
  if (kind == "sparse_streak") {
    CheckFields(kind, p, {"thickness_ratio", "layer_count", "streaks_per_layer", "streaks"},
                status);
    CheckMax("layer_count", p.layer_count, kMaxStreakLayers, status);
    CheckMax("streaks_per_layer", p.streaks_per_layer, kMaxStreakCount, status);
    float thickness_ratio = p.thickness_ratio.value_or(0.25f);
    if (p.streaks) {
      return SparseStreakRing(thickness_ratio, *p.streaks);
    }
    return SparseStreakRing::Random(rng, thickness_ratio, p.layer_count.value_or(6),
                                    p.streaks_per_layer.value_or(IntRange{1, 6}));
  }
  if (kind == "broadcast") {
    CheckFields(kind, p,
                {"thickness_ratio", "layer_count", "ray_count_range", "span_width_ratio_range",
                 "uniform_spacing", "spans"},
                status);
    CheckMax("layer_count", p.layer_count, kMaxBroadcastLayers, status);
    CheckMax("ray_count_range", p.ray_count_range, kMaxRayCount, status);
    float thickness_ratio = p.thickness_ratio.value_or(0.8f);
    int layer_count = p.layer_count.value_or(6);
    if (p.spans) {
      return BroadcastRing(thickness_ratio, layer_count, *p.spans);
    }
    return BroadcastRing::Random(rng, thickness_ratio, layer_count,
                                 p.ray_count_range.value_or(IntRange{2, 6}),
                                 p.span_width_ratio_range.value_or(Range{0.1f, 0.9f}),
                                 p.uniform_spacing.value_or(true));
  }
  if (kind == "tech") {
    CheckFields(kind, p, {"inset_ratio", "span_count_range", "spans", "raw_spans"}, status);
    CheckMax("span_count_range", p.span_count_range, kMaxNotchCount, status);
    float inset_ratio = p.inset_ratio.value_or(0.1f);
    if (p.raw_spans) {
      return TechRing(inset_ratio, *p.raw_spans);
    }
    if (p.spans) {
      return TechRing(inset_ratio, *p.spans);
    }
    return TechRing::Random(rng, inset_ratio, p.span_count_range.value_or(IntRange{2, 5}));
  }
  if (kind == "hollow_tech") {
    CheckFields(kind, p,
                {"inset_ratio", "thickness_ratio", "outer_span_count_range",
                 "inner_span_count_range", "outer_spans", "inner_spans"},
                status);
    CheckMax("outer_span_count_range", p.outer_span_count_range, kMaxNotchCount, status);
    CheckMax("inner_span_count_range", p.inner_span_count_range, kMaxNotchCount, status);
    float inset_ratio = p.inset_ratio.value_or(0.1f);
    float thickness_ratio = p.thickness_ratio.value_or(0.25f);
    IntRange outer_range = p.outer_span_count_range.value_or(IntRange{2, 5});
    IntRange inner_range = p.inner_span_count_range.value_or(IntRange{1, 4});
    if (!p.outer_spans && !p.inner_spans) {
      return HollowTechRing::Random(rng, inset_ratio, thickness_ratio, outer_range, inner_range);
    }
    // Only one of the edges is given explicitly. The other one is random.
    auto outer = p.outer_spans ? FlattenSpans(*p.outer_spans)
                               : RandomNotches(rng, outer_range, {0.2f, 0.8f});
    auto inner = p.inner_spans ? FlattenSpans(*p.inner_spans)
                               : RandomNotches(rng, inner_range, {0.2f, 0.8f});
    return HollowTechRing(inset_ratio, thickness_ratio, std::move(outer), std::move(inner));
  }
  if (kind == "wave" || kind == "hollow_wave") {
    bool hollow = kind == "hollow_wave";
    if (hollow) {
      CheckFields(kind, p,
                  {"amplitude_ratio", "frequency", "outer_control_ratio", "inner_control_ratio",
                   "thickness_ratio"},
                  status);
    } else {
      CheckFields(kind, p,
                  {"amplitude_ratio", "frequency", "outer_control_ratio", "inner_control_ratio"},
                  status);
    }
    WaveRing defaults;
    WaveRing wave(p.amplitude_ratio.value_or(defaults.amplitude_ratio),
                  p.frequency.value_or(defaults.frequency),
                  p.outer_control_ratio.value_or(defaults.outer_control_ratio),
                  p.inner_control_ratio.value_or(defaults.inner_control_ratio));
    if (!hollow) {
      return wave;
    }
    return HollowWaveRing(wave.amplitude_ratio, wave.frequency, wave.outer_control_ratio,
                          wave.inner_control_ratio, p.thickness_ratio.value_or(0.2f));
  }
  if (kind == "gear") {
    CheckFields(kind, p,
                {"tooth_count", "tooth_depth_ratio", "spoke_count", "spoke_width_ratio",
                 "include_center_hole"},
                status);
    GearRing defaults;
    return GearRing(p.tooth_count.value_or(defaults.tooth_count),
                    p.tooth_depth_ratio.value_or(defaults.tooth_depth_ratio),
                    p.spoke_count.value_or(defaults.spoke_count),
                    p.spoke_width_ratio.value_or(defaults.spoke_width_ratio),
                    p.include_center_hole.value_or(defaults.include_center_hole));
  }
  if (kind == "burst") {
    CheckFields(kind, p, {"thickness", "width_range", "spacing_range"}, status);
    return BurstRing::Random(rng, p.thickness.value_or(20.f),
                             p.width_range.value_or(Range{0.5f, 1.2f}),
                             p.spacing_range.value_or(Range{0.5f, 4.f}));
  }
  AppendErrorMessage(status) += f("Unknown ring kind \"{}\"", kind);
  return std::nullopt;
}

const char kDefaultConfigJson[] = R"({
  "cell_size": 200,
  "padding": 8,
  "spacing": 12,
  "background": "#ffffff",
  "rows": [
    {
      "title": "Gear Rings",
      "rings": [
        {"kind": "gear", "color": "#ff3b30"},
        {"kind": "gear", "color": "#34c759", "rotation": 18, "tooth_count": 7,
         "tooth_depth_ratio": 0.5, "spoke_count": 3, "spoke_width_ratio": 0.9,
         "include_center_hole": true},
        {"kind": "gear", "color": "#007aff", "tooth_count": 64, "tooth_depth_ratio": 0.9,
         "spoke_count": 12, "include_center_hole": false}
      ]
    },
    {
      "title": "Burst Rings",
      "rings": [
        {"kind": "burst", "thickness": 40, "background": "#007aff", "color": "#34c759"},
        {"kind": "burst", "thickness": 20, "background": "#ff3b30", "color": "#ffcc00"},
        {"kind": "burst", "thickness": 10, "background": "#af52de", "color": "#ff9500"}
      ]
    },
    {
      "title": "Tech Rings",
      "rings": [
        {"kind": "tech", "color": "#007aff"},
        {"kind": "hollow_tech", "color": "#34c759", "thickness_ratio": 0.25},
        {"kind": "tech", "color": "#ff3b30", "style": "stroke", "stroke_width": 4,
         "inset_ratio": 0.05, "span_count_range": [6, 6]},
        {"kind": "hollow_tech", "color": "#ff9500"},
        {"kind": "tech", "color": "#ffcc00", "style": "fill_and_stroke", "stroke_color": "#000000",
         "stroke_width": 2, "inset_ratio": 0.2, "span_count_range": [1, 3]}
      ]
    },
    {
      "title": "Wave Rings",
      "rings": [
        {"kind": "wave", "color": "#007aff"},
        {"kind": "wave", "color": "#34c759", "amplitude_ratio": 0.5, "frequency": 16},
        {"kind": "hollow_wave", "color": "#ff3b30", "amplitude_ratio": 0.9, "frequency": 27,
         "thickness_ratio": 0.1},
        {"kind": "hollow_wave", "color": "#af52de", "amplitude_ratio": 0.4, "frequency": 2,
         "thickness_ratio": 0.5},
        {"kind": "hollow_wave", "color": "#ff9500", "amplitude_ratio": 0.2, "frequency": 1,
         "thickness_ratio": 0.3}
      ]
    },
    {
      "title": "Streak Rings",
      "rings": [
        {"kind": "gauge", "color": "#000000", "style": "stroke", "stroke_width": 2},
        {"kind": "offset_streak", "color": "#007aff", "style": "stroke", "stroke_width": 3},
        {"kind": "offset_streak", "color": "#af52de", "style": "stroke", "stroke_width": 3,
         "clockwise": false, "streak_arc": 1.5},
        {"kind": "sparse_streak", "color": "#34c759", "style": "stroke", "stroke_width": 3},
        {"kind": "broadcast", "color": "#ff3b30", "style": "stroke", "stroke_width": 3},
        {"kind": "broadcast", "color": "#ff9500", "style": "stroke", "stroke_width": 3,
         "uniform_spacing": false, "ray_count_range": [3, 4]}
      ]
    }
  ]
})";

GalleryConfig DefaultConfig() {
  GalleryConfig config;
  Status status;
  LoadConfigFromString(kDefaultConfigJson, config, status);
  if (!OK(status)) {
    FATAL << "Built-in gallery config is broken: " << status;
  }
  return config;
}

}  // namespace ringkit
