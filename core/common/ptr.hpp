/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

namespace x402 {
  template <typename T>
  std::weak_ptr<T> weaken(const std::shared_ptr<T> &ptr) {
    return ptr;
  }
  template <typename T>
  std::weak_ptr<T> weaken(std::enable_shared_from_this<T> &ptr) {
    return ptr.weak_from_this();
  }

  /** Calls `cb(ptr, args...)` only while `ptr` is alive */
  template <typename T, typename Cb>
  auto weakCb(T &&ptr, Cb &&cb) {
    return [weak{weaken(std::forward<T>(ptr))},
            cb{std::forward<Cb>(cb)}](auto &&...args) {
      if (auto ptr{weak.lock()}) {
        cb(std::move(ptr), std::forward<decltype(args)>(args)...);
      }
    };
  }
}  // namespace x402
