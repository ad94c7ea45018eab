// SPDX-FileCopyrightText: Copyright 2025 Ringkit Authors
// SPDX-License-Identifier: MIT
#include "status.hh"

namespace ringkit {

std::string& AppendErrorMessage(Status& status) {
  if (!status.error.empty()) {
    status.error += "; ";
  }
  return status.error;
}

}  // namespace ringkit
