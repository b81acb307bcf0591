/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <csignal>
#include <cstdlib>

#include "api/gateway.hpp"
#include "api/http_routes.hpp"
#include "common/logger.hpp"
#include "node/main/builder.hpp"

namespace x402 {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("node");
      return logger.get();
    }

    void reconcileLoop(std::shared_ptr<boost::asio::steady_timer> timer,
                       std::shared_ptr<facilitator::SettlementEngine> engine,
                       std::chrono::seconds period) {
      timer->expires_after(period);
      timer->async_wait([=](const boost::system::error_code &ec) {
        if (ec) {
          return;
        }
        engine->reconcile([](size_t resolved) {
          if (resolved != 0) {
            log()->info("reconciled {} pending settlements", resolved);
          }
        });
        engine->prune();
        reconcileLoop(timer, engine, period);
      });
    }
  }  // namespace

  void main(node::Config &config) {
    auto _objects{node::createFacilitatorObjects(config)};
    if (!_objects) {
      log()->error("Cannot start facilitator: {}",
                   _objects.error().message());
      exit(EXIT_FAILURE);
    }
    auto &o{_objects.value()};

    auto ws_routes{std::make_shared<api::WsRoutes>()};
    ws_routes->emplace("/ws", api::FacilitatorGateway::factory(o.facilitator));
    if (o.stream_manager) {
      ws_routes->emplace("/stream", o.stream_manager->factory());
    }
    auto routes{std::make_shared<api::Routes>()};
    routes->emplace("/health",
                    [](const api::HttpRequest &request, api::RouteCB cb) {
                      cb(api::makeJsonResponse(request,
                                               api::http::status::ok,
                                               R"({"status":"UP"})"));
                    });
    api::setupFacilitatorRoutes(*routes, o.facilitator);

    api::serve(ws_routes, routes, *o.io_context, config.host, config.port);
    log()->info("Facilitator started at {}:{}", config.host, config.port);

    if (config.reconcile_period.count() > 0) {
      reconcileLoop(std::make_shared<boost::asio::steady_timer>(*o.io_context),
                    o.settlement_engine,
                    config.reconcile_period);
    }

    // gracefully shutdown on signal
    boost::asio::signal_set signals(*o.io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &, int) {
      o.io_context->stop();
    });

    o.io_context->run();
    log()->info("Facilitator stopped");
  }
}  // namespace x402

int main(int argc, char *argv[]) {
  auto config{x402::node::Config::read(argc, argv)};
  x402::main(config);
}
