// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPath.h>

#include "log.hh"

namespace ringkit {

// Prints a one-line summary: verb & point counts, and the bounds.
const LogEntry& operator<<(const LogEntry&, const SkPath&);

}  // namespace ringkit
