// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkColor.h>

#include "format.hh"
#include "status.hh"

namespace ringkit::color {

// Palette used by the built-in gallery sheet.
constexpr SkColor kRed = SkColorSetRGB(0xff, 0x3b, 0x30);
constexpr SkColor kOrange = SkColorSetRGB(0xff, 0x95, 0x00);
constexpr SkColor kYellow = SkColorSetRGB(0xff, 0xcc, 0x00);
constexpr SkColor kGreen = SkColorSetRGB(0x34, 0xc7, 0x59);
constexpr SkColor kBlue = SkColorSetRGB(0x00, 0x7a, 0xff);
constexpr SkColor kPurple = SkColorSetRGB(0xaf, 0x52, 0xde);
constexpr SkColor kBlack = SK_ColorBLACK;
constexpr SkColor kWhite = SK_ColorWHITE;

}  // namespace ringkit::color

namespace ringkit {

// "#rrggbb" or "#rrggbbaa" (when the color isn't opaque).
Str ToStr(SkColor color);

// Parses "#rrggbb" or "#rrggbbaa". Digits are case-insensitive.
SkColor ParseHexColor(StrView hex, Status& status);

}  // namespace ringkit
