// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "even_odd.hh"

#include <include/pathops/SkPathOps.h>

#include "log_skia.hh"

namespace ringkit {

SkPath NormalizeEvenOdd(SkPath path) {
  path.setFillType(SkPathFillType::kEvenOdd);
  SkPath simplified;
  if (!Simplify(path, &simplified)) {
    ERROR << "Couldn't simplify even-odd " << path << ". Using it as-is.";
    return path;
  }
  return simplified;
}

SkPath CombineEvenOdd(std::initializer_list<SkPath> contours) {
  SkPath combined;
  for (const SkPath& contour : contours) {
    combined.addPath(contour);
  }
  return NormalizeEvenOdd(std::move(combined));
}

}  // namespace ringkit
