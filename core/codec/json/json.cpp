/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json.hpp"

#include <rapidjson/reader.h>
#include <rapidjson/writer.h>

#include "codec/json/json_errors.hpp"

namespace x402::codec::json {
  using rapidjson::StringBuffer;

  outcome::result<Document> parse(std::string_view input) {
    Document doc;
    doc.Parse(input.data(), input.size());
    if (doc.HasParseError()) {
      return JsonError::kParseError;
    }
    return std::move(doc);
  }

  outcome::result<Document> parse(BytesIn input) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return parse(std::string_view{reinterpret_cast<const char *>(input.data()),
                                  static_cast<size_t>(input.size())});
  }

  outcome::result<std::string> format(JIn j) {
    StringBuffer buffer;
    rapidjson::Writer<StringBuffer> writer{buffer};
    if (j->Accept(writer)) {
      return std::string{buffer.GetString(), buffer.GetSize()};
    }
    return JsonError::kFormatError;
  }

  outcome::result<std::string> format(Document &&doc) {
    return format(&doc);
  }

  outcome::result<JIn> jGet(JIn j, std::string_view key) {
    if (j->IsObject()) {
      auto it{j->FindMember(
          Value{key.data(), static_cast<rapidjson::SizeType>(key.size())})};
      if (it != j->MemberEnd()) {
        return &it->value;
      }
    }
    return JsonError::kOutOfRange;
  }

  outcome::result<std::string_view> jStr(JIn j) {
    if (j->IsString()) {
      return std::string_view{j->GetString(), j->GetStringLength()};
    }
    return JsonError::kWrongType;
  }
}  // namespace x402::codec::json
