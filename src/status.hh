// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <string>

namespace ringkit {

// Carries the outcome of an operation that may fail.
//
// Functions that can fail take a `Status&` as their last argument and append a
// description of the problem to it. Callers check the result with `OK(status)`:
//
//   Status status;
//   LoadConfig(path, config, status);
//   if (!OK(status)) {
//     ERROR << "Couldn't load config: " << status;
//   }
struct Status {
  std::string error;

  void Reset() { error.clear(); }
  const std::string& ToStr() const { return error; }
};

inline bool OK(const Status& status) { return status.error.empty(); }

// Returns the message buffer of `status`, separating it from any earlier message.
std::string& AppendErrorMessage(Status& status);

}  // namespace ringkit
