// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "tech_ring.hh"

#include <algorithm>

#include "even_odd.hh"
#include "log.hh"

namespace ringkit {

std::vector<float> FlattenSpans(const std::vector<Span>& spans) {
  std::vector<float> flat;
  flat.reserve(spans.size() * 2);
  for (const Span& span : spans) {
    flat.push_back(span.start);
    flat.push_back(span.end);
  }
  return flat;
}

std::vector<float> RandomNotches(XorShift32& rng, IntRange count_range, Range width_ratio_range) {
  float a_offset = rng.RollFloat(0, kTau);
  int notch_count = count_range.Clamp(1, kMaxNotchCount).Roll(rng);
  float notch_span = kTau / notch_count;
  std::vector<float> spans;
  spans.reserve(notch_count * 2);
  for (int i = 0; i < notch_count; ++i) {
    float slot_start = notch_span * i + a_offset;
    float notch_width = notch_span * width_ratio_range.Roll(rng);
    float space = notch_span - notch_width;
    float notch_start = rng.RollFloat(0.2f, 0.8f) * space + slot_start;
    spans.push_back(notch_start);
    spans.push_back(notch_start + notch_width);
  }
  return spans;
}

float TransitionAngle(float outer_radius, float inset) {
  float r0_sq = outer_radius * outer_radius;
  float cos_t = (2 * r0_sq - inset * inset) / (2 * r0_sq);
  return acosf(std::clamp(cos_t, -1.f, 1.f));
}

// Outline of a notched ring centered at `center`.
static SkPath NotchedRingPath(const std::vector<float>& spans, float radius, float inset,
                              Vec2 center) {
  SkPath path;
  if (spans.size() < 2 || spans.size() % 2 != 0) {
    if (strict_diagnostics) {
      ERROR << "Notch list needs an even number of angles (at least 2), got " << spans.size()
            << ". Drawing nothing.";
    }
    return path;
  }
  if (radius <= 0) {
    return path;
  }
  float r0 = radius;
  float r1 = radius - inset;
  float transition = TransitionAngle(r0, fabsf(r0 - r1));
  path.moveTo(PointOnCircle(center, r0, spans[0]));
  for (size_t i = 0; i < spans.size(); i += 2) {
    float a0 = spans[i];
    float a3 = spans[i + 1];
    float a1 = a0 + transition;
    float a2 = a3 - transition;
    path.lineTo(PointOnCircle(center, r1, a1));
    AddArc(path, center, r1, a1, a2);
    path.lineTo(PointOnCircle(center, r0, a3));
    if (i + 2 < spans.size()) {
      AddArc(path, center, r0, a3, spans[i + 2]);
    }
  }
  AddArc(path, center, r0, spans.back(), spans.front());
  path.close();
  return path;
}

TechRing::TechRing(float inset_ratio, std::vector<float> raw_spans)
    : inset_ratio(std::clamp(inset_ratio, 0.f, 1.f)), spans(std::move(raw_spans)) {}

TechRing::TechRing(float inset_ratio, const std::vector<Span>& spans)
    : TechRing(inset_ratio, FlattenSpans(spans)) {}

TechRing TechRing::Random(XorShift32& rng, float inset_ratio, IntRange span_count_range) {
  return TechRing(inset_ratio, RandomNotches(rng, span_count_range, {0.25f, 0.75f}));
}

SkPath TechRing::PathIn(Rect rect) const {
  Rect square = rect.CenteredSquare();
  float radius = square.Width() / 2;
  return NotchedRingPath(spans, radius, radius * inset_ratio, square.Center());
}

HollowTechRing::HollowTechRing(float inset_ratio, float thickness_ratio,
                               std::vector<float> raw_outer_spans,
                               std::vector<float> raw_inner_spans)
    : inset_ratio(std::clamp(inset_ratio, 0.f, 1.f)),
      thickness_ratio(std::clamp(thickness_ratio, 0.f, 1.f)),
      outer_spans(std::move(raw_outer_spans)),
      inner_spans(std::move(raw_inner_spans)) {}

HollowTechRing::HollowTechRing(float inset_ratio, float thickness_ratio,
                               const std::vector<Span>& outer_spans,
                               const std::vector<Span>& inner_spans)
    : HollowTechRing(inset_ratio, thickness_ratio, FlattenSpans(outer_spans),
                     FlattenSpans(inner_spans)) {}

HollowTechRing HollowTechRing::Random(XorShift32& rng, float inset_ratio, float thickness_ratio,
                                      IntRange outer_span_count_range,
                                      IntRange inner_span_count_range) {
  auto outer = RandomNotches(rng, outer_span_count_range, {0.2f, 0.8f});
  auto inner = RandomNotches(rng, inner_span_count_range, {0.2f, 0.8f});
  return HollowTechRing(inset_ratio, thickness_ratio, std::move(outer), std::move(inner));
}

Rect HollowTechRing::InnerRect(Rect rect) const {
  Rect square = rect.CenteredSquare();
  float radius = square.Width() / 2;
  float inset = radius * inset_ratio;
  float thickness = radius * thickness_ratio;
  return square.Inset(thickness - inset);
}

SkPath HollowTechRing::PathIn(Rect rect) const {
  Rect square = rect.CenteredSquare();
  Rect inner_rect = InnerRect(rect);
  SkPath outer = TechRing(inset_ratio, outer_spans).PathIn(square);
  if (inner_rect.Width() <= 0) {
    // The band is as thick as the ring - nothing to cut out.
    return NormalizeEvenOdd(std::move(outer));
  }
  SkPath inner = TechRing(inset_ratio, inner_spans).PathIn(inner_rect);
  return CombineEvenOdd({outer, inner});
}

}  // namespace ringkit
