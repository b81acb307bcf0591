/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant/apply_visitor.hpp>

namespace x402 {
  template <typename... Lambdas>
  struct LambdaVisitor : Lambdas... {
    using Lambdas::operator()...;
  };
  template <typename... Lambdas>
  LambdaVisitor(Lambdas...) -> LambdaVisitor<Lambdas...>;

  /**
   * @brief Inplace visitor for boost::variant.
   * @code
   *   boost::variant<int, std::string> value = "1234";
   *   ...
   *   visit_in_place(value,
   *                  [](int v) { std::cout << "(int)" << v; },
   *                  [](std::string v) { std::cout << "(string)" << v;}
   *                  );
   * @endcode
   */
  template <typename TVariant, typename... TVisitors>
  decltype(auto) visit_in_place(TVariant &&variant, TVisitors &&...visitors) {
    return boost::apply_visitor(
        LambdaVisitor{std::forward<TVisitors>(visitors)...},
        std::forward<TVariant>(variant));
  }
}  // namespace x402
