/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace x402::common {
  Logger createLogger(const std::string &tag) {
    if (auto logger{spdlog::get(tag)}) {
      return logger;
    }
    try {
      auto logger{spdlog::stderr_color_mt(tag)};
      logger->set_level(spdlog::get_level());
      return logger;
    } catch (const spdlog::spdlog_ex &) {
      // registered concurrently by another thread
      return spdlog::get(tag);
    }
  }
}  // namespace x402::common
