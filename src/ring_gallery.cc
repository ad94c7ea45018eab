// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT

// Renders a sheet of rings into an image.
//
// Usage: ring_gallery [--config FILE] [--out FILE] [--seed N] [--row SLUG] [--strict]
//        ring_gallery --print-default-config

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <optional>

#include "format.hh"
#include "gallery.hh"
#include "gallery_config.hh"
#include "log.hh"
#include "random.hh"
#include "status.hh"

using namespace ringkit;

constexpr char kUsage[] =
    "Usage: ring_gallery [--config FILE] [--out FILE] [--seed N] [--row SLUG] [--strict]\n"
    "       ring_gallery --print-default-config\n"
    "\n"
    "  --config FILE           JSON gallery description. Defaults to the built-in sheet.\n"
    "  --out FILE              Output image (.png or .webp). Defaults to rings.png.\n"
    "  --seed N                Seed for the randomized rings. Overrides the config seed.\n"
    "  --row SLUG              Only render the row whose title matches (\"gear-rings\").\n"
    "  --strict                Report degenerate ring parameters.\n"
    "  --print-default-config  Print the built-in sheet & exit.\n";

struct Options {
  Str config_path;
  Str out_path = "rings.png";
  std::optional<int64_t> seed;
  Str row;
  bool strict = false;
  bool print_default_config = false;
  bool help = false;
};

static Options ParseOptions(int argc, char* argv[], Status& status) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    StrView arg = argv[i];
    auto NextValue = [&]() -> StrView {
      if (i + 1 >= argc) {
        AppendErrorMessage(status) += f("{} needs a value", arg);
        return {};
      }
      return argv[++i];
    };
    if (arg == "--config") {
      options.config_path = NextValue();
    } else if (arg == "--out") {
      options.out_path = NextValue();
    } else if (arg == "--seed") {
      StrView value = NextValue();
      int64_t seed = 0;
      auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), seed);
      if (ec != std::errc() || end != value.data() + value.size() || value.empty()) {
        AppendErrorMessage(status) += f("Invalid seed \"{}\"", value);
      } else {
        options.seed = seed;
      }
    } else if (arg == "--row") {
      options.row = Slugify(NextValue());
    } else if (arg == "--strict") {
      options.strict = true;
    } else if (arg == "--print-default-config") {
      options.print_default_config = true;
    } else if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else {
      AppendErrorMessage(status) += f("Unknown argument \"{}\"", arg);
    }
  }
  return options;
}

int main(int argc, char* argv[]) {
  Status status;
  Options options = ParseOptions(argc, argv, status);
  if (!OK(status)) {
    ERROR << status;
    fputs(kUsage, stderr);
    return 2;
  }
  if (options.help) {
    fputs(kUsage, stdout);
    return 0;
  }
  if (options.print_default_config) {
    puts(kDefaultConfigJson);
    return 0;
  }
  strict_diagnostics = options.strict;

  GalleryConfig config;
  if (options.config_path.empty()) {
    config = DefaultConfig();
  } else {
    LoadConfig(options.config_path, config, status);
    if (!OK(status)) {
      // Broken fields fall back to defaults. Keep going so that the rest of the sheet is visible.
      ERROR << status;
      status.Reset();
    }
  }

  if (!options.row.empty()) {
    std::erase_if(config.rows,
                  [&](const GalleryRow& row) { return Slugify(row.title) != options.row; });
    if (config.rows.empty()) {
      ERROR << "No row matches \"" << options.row << "\"";
      return 1;
    }
  }

  std::optional<int64_t> seed = options.seed ? options.seed : config.seed;
  XorShift32 rng = seed ? XorShift32::MakeFromSeed(*seed) : XorShift32::MakeFromCurrentTime();
  if (seed) {
    LOG << "Using seed " << f("{}", *seed);
  }

  RenderGallery(config, rng, options.out_path, status);
  if (!OK(status)) {
    ERROR << status;
    return 1;
  }
  return 0;
}
