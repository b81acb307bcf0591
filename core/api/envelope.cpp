/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/envelope.hpp"

namespace x402::api {
  Document clone(const Value &value) {
    Document doc;
    doc.CopyFrom(value, doc.GetAllocator());
    return doc;
  }
}  // namespace x402::api
