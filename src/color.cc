// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "color.hh"

namespace ringkit {

Str ToStr(SkColor color) {
  if (SkColorGetA(color) == 0xff) {
    return f("#{:02x}{:02x}{:02x}", SkColorGetR(color), SkColorGetG(color), SkColorGetB(color));
  }
  return f("#{:02x}{:02x}{:02x}{:02x}", SkColorGetR(color), SkColorGetG(color), SkColorGetB(color),
           SkColorGetA(color));
}

static int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

SkColor ParseHexColor(StrView hex, Status& status) {
  if (hex.empty() || hex[0] != '#' || (hex.size() != 7 && hex.size() != 9)) {
    AppendErrorMessage(status) +=
        f("Expected a color like \"#rrggbb\" or \"#rrggbbaa\", got \"{}\"", hex);
    return SK_ColorBLACK;
  }
  uint8_t channels[4] = {0, 0, 0, 0xff};
  int n_channels = (hex.size() - 1) / 2;
  for (int i = 0; i < n_channels; ++i) {
    int hi = HexDigit(hex[1 + i * 2]);
    int lo = HexDigit(hex[2 + i * 2]);
    if (hi < 0 || lo < 0) {
      AppendErrorMessage(status) += f("Invalid hex digit in color \"{}\"", hex);
      return SK_ColorBLACK;
    }
    channels[i] = hi * 16 + lo;
  }
  return SkColorSetARGB(channels[3], channels[0], channels[1], channels[2]);
}

}  // namespace ringkit
