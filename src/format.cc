// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "format.hh"

namespace ringkit {

Str Slugify(StrView in) {
  Str out;
  bool unk = false;
  for (char c : in) {
    bool alnum = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    bool upper = c >= 'A' && c <= 'Z';
    if (!alnum && !upper) {
      unk = true;
      continue;
    }
    if (unk) {
      if (!out.empty()) {
        out += '-';
      }
      unk = false;
    }
    out += upper ? (char)(c - 'A' + 'a') : c;
  }
  return out;
}

}  // namespace ringkit
