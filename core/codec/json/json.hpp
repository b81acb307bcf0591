/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace x402::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;
  using JIn = const Value *;

  outcome::result<Document> parse(std::string_view input);

  outcome::result<Document> parse(BytesIn input);

  outcome::result<std::string> format(JIn j);
  outcome::result<std::string> format(Document &&doc);

  outcome::result<JIn> jGet(JIn j, std::string_view key);

  outcome::result<std::string_view> jStr(JIn j);
}  // namespace x402::codec::json
