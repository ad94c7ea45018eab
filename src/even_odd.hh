// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPath.h>

#include <initializer_list>

namespace ringkit {

// Resolve the contours of `path` with the even-odd rule into non-overlapping contours.
//
// Regions covered an even number of times become holes. This is what turns the inset contour of a
// hollow ring into a cut-out. If Skia can't simplify the path, the input is returned with its fill
// type set to even-odd, which fills the same area.
SkPath NormalizeEvenOdd(SkPath path);

// Append all `contours` into one path and resolve it with the even-odd rule.
SkPath CombineEvenOdd(std::initializer_list<SkPath> contours);

}  // namespace ringkit
