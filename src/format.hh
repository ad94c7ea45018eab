// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace ringkit {

using Str = std::string;
using StrView = std::string_view;

// Format strings using fmt library
template <typename... Args>
Str f(fmt::format_string<Args...> fmt, Args&&... args) {
  return fmt::format(fmt, std::forward<Args>(args)...);
}

// Convert a display name ("Gear Rings") into a lower-case identifier ("gear-rings").
Str Slugify(StrView in);

}  // namespace ringkit
