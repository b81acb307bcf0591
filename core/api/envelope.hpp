/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant.hpp>

#include "codec/json/coding.hpp"

namespace x402::api {
  using codec::json::Document;
  using codec::json::Value;

  constexpr auto kParseError = INT64_C(-32700);
  constexpr auto kInvalidRequest = INT64_C(-32600);
  constexpr auto kMethodNotFound = INT64_C(-32601);
  constexpr auto kInvalidParams = INT64_C(-32602);
  constexpr auto kInternalError = INT64_C(-32603);
  /// Request id is still in flight on this connection
  constexpr auto kIdCollision = INT64_C(-32000);
  /// Settlement could not be attempted
  constexpr auto kSettlementFailed = INT64_C(1001);
  /// Facilitator could not reach the chain
  constexpr auto kRpcUnavailable = INT64_C(1002);

  /**
   * {id, method, params}, id is any JSON value and echoed verbatim
   */
  struct Request {
    Document id;
    std::string method;
    Document params;
  };

  struct Response {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    struct Error {
      int64_t code;
      std::string message;
      /// omitted when null
      Document data;
    };

    Document id;
    boost::variant<Error, Document> result;
  };

  /**
   * Session message sent by the server: as result of the request it answers,
   * {id, result: {method, params}}, or unsolicited {id, method, params}
   */
  struct Notification {
    std::string method;
    Document params;
  };

  /** Deep copy */
  Document clone(const Value &value);

  inline Response makeError(const Value &id,
                            int64_t code,
                            std::string message) {
    return {clone(id), Response::Error{code, std::move(message), {}}};
  }

  using codec::json::AsString;
  using codec::json::encode;
  using codec::json::Get;
  using codec::json::JsonError;
  using codec::json::Set;

  JSON_ENCODE(Request) {
    Value j{rapidjson::kObjectType};
    Set(j, "id", Value{v.id, allocator}, allocator);
    Set(j, "method", v.method, allocator);
    Set(j, "params", Value{v.params, allocator}, allocator);
    return j;
  }

  JSON_DECODE(Request) {
    if (!j.IsObject()) {
      outcome::raise(JsonError::kWrongType);
    }
    auto id{j.FindMember("id")};
    if (id == j.MemberEnd()
        || !(id->value.IsString() || id->value.IsNumber())) {
      outcome::raise(JsonError::kWrongParams);
    }
    v.id = clone(id->value);
    v.method = AsString(Get(j, "method"));
    auto params{j.FindMember("params")};
    v.params = params == j.MemberEnd() ? Document{} : clone(params->value);
  }

  JSON_ENCODE(Response::Error) {
    Value j{rapidjson::kObjectType};
    Set(j, "code", v.code, allocator);
    Set(j, "message", v.message, allocator);
    if (!v.data.IsNull()) {
      Set(j, "data", Value{v.data, allocator}, allocator);
    }
    return j;
  }

  JSON_ENCODE(Response) {
    Value j{rapidjson::kObjectType};
    Set(j, "id", Value{v.id, allocator}, allocator);
    if (const auto *error = boost::get<Response::Error>(&v.result)) {
      Set(j, "error", encode(*error, allocator), allocator);
    } else {
      Set(j,
          "result",
          Value{boost::get<Document>(v.result), allocator},
          allocator);
    }
    return j;
  }
}  // namespace x402::api
