// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "log_skia.hh"

#include "format.hh"
#include "math.hh"

namespace ringkit {

const LogEntry& operator<<(const LogEntry& logger, const SkPath& path) {
  Rect bounds = path.getBounds();
  logger << f("SkPath({} verbs, {} points, bounds {})", path.countVerbs(), path.countPoints(),
              bounds.ToStr());
  return logger;
}

}  // namespace ringkit
