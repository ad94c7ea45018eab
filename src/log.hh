// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <concepts>
#include <functional>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

// Functions for logging human-readable messages.
//
// Usage:
//
//   LOG << "regular message";
//   ERROR << "error message";
//   FATAL << "stop the execution / print the source location";
//
// Logging accepts strings, integers, floats and the geometry types from
// math.hh. There is no need to add a new line character at the end of the
// logged message - it's added there automatically.

namespace ringkit {

enum class LogLevel { Info, Error, Fatal };

struct LogEntry {
  LogLevel log_level;
  std::source_location location;
  mutable std::string buffer;

  LogEntry(LogLevel, const std::source_location location = std::source_location::current());
  ~LogEntry();
};

// Sinks receive every finished entry. Stdout is registered by default.
using Logger = std::function<void(const LogEntry&)>;

extern std::vector<Logger> loggers;

struct LOG : public LogEntry {
  LOG(const std::source_location location = std::source_location::current())
      : LogEntry(LogLevel::Info, location) {}
};

struct ERROR : public LogEntry {
  ERROR(const std::source_location location = std::source_location::current())
      : LogEntry(LogLevel::Error, location) {}
};

struct FATAL : public LogEntry {
  FATAL(const std::source_location location = std::source_location::current())
      : LogEntry(LogLevel::Fatal, location) {}
};

const LogEntry& operator<<(const LogEntry&, int);
const LogEntry& operator<<(const LogEntry&, unsigned);
const LogEntry& operator<<(const LogEntry&, unsigned long);
const LogEntry& operator<<(const LogEntry&, unsigned long long);
const LogEntry& operator<<(const LogEntry&, float);
const LogEntry& operator<<(const LogEntry&, double);
const LogEntry& operator<<(const LogEntry&, std::string_view);
const LogEntry& operator<<(const LogEntry&, const char*);

template <typename T>
concept loggable = requires(const T& v) {
  { v.ToStr() } -> std::convertible_to<std::string_view>;
};

const LogEntry& operator<<(const LogEntry& logger, const loggable auto& t) {
  return logger << std::string_view(t.ToStr());
}

void LOG_Indent(int n = 2);

void LOG_Unindent(int n = 2);

// When set, ring generators report degenerate inputs (for example an odd notch list) with ERROR
// before falling back to their documented output.
extern bool strict_diagnostics;

}  // namespace ringkit
