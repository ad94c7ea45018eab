// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "log.hh"

#include <cstdio>
#include <cstdlib>

#include "format.hh"

namespace ringkit {

std::vector<Logger> loggers;
static int indent = 0;
bool strict_diagnostics = false;

void __attribute__((__constructor__)) InitDefaultLoggers() {
  loggers.emplace_back([](const LogEntry& e) {
    FILE* out = e.log_level == LogLevel::Info ? stdout : stderr;
    fprintf(out, "%s\n", e.buffer.c_str());
  });
}

void LOG_Indent(int n) { indent += n; }

void LOG_Unindent(int n) { indent -= n; }

LogEntry::LogEntry(LogLevel log_level, const std::source_location location)
    : log_level(log_level), location(location), buffer() {
  for (int i = 0; i < indent; ++i) {
    buffer += " ";
  }
}

LogEntry::~LogEntry() {
  if (log_level == LogLevel::Fatal) {
    buffer += f(" Crashing in {}:{} [{}].", location.file_name(), location.line(),
                location.function_name());
  }

  for (auto& logger : loggers) {
    logger(*this);
  }

  if (log_level == LogLevel::Fatal) {
    abort();
  }
}

const LogEntry& operator<<(const LogEntry& logger, int i) {
  logger.buffer += std::to_string(i);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, unsigned i) {
  logger.buffer += std::to_string(i);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, unsigned long i) {
  logger.buffer += std::to_string(i);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, unsigned long long i) {
  logger.buffer += std::to_string(i);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, float x) {
  logger.buffer += f("{}", x);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, double d) {
  logger.buffer += f("{}", d);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, std::string_view s) {
  logger.buffer += s;
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, const char* s) {
  logger.buffer += s;
  return logger;
}

}  // namespace ringkit
