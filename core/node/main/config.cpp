/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/main/config.hpp"

#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>

#include "primitives/address/address_codec.hpp"
#include "stream/types.hpp"

namespace x402::primitives {
  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       Network *,
                       long) {
    using namespace boost::program_options;
    check_first_occurrence(out);
    auto &value{get_single_string(values)};
    if (auto network{networkFromName(value)}) {
      out = network.value();
      return;
    }
    boost::throw_exception(invalid_option_value{value});
  }

  namespace address {
    inline void validate(boost::any &out,
                         const std::vector<std::string> &values,
                         Address *,
                         long) {
      using namespace boost::program_options;
      check_first_occurrence(out);
      auto &value{get_single_string(values)};
      if (auto address{decodeFromString(value)}) {
        out = address.value();
        return;
      }
      boost::throw_exception(invalid_option_value{value});
    }
  }  // namespace address
}  // namespace x402::primitives

namespace x402::node {
  spdlog::level::level_enum getLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }

  Config Config::read(int argc, char **argv) {
    Config config;
    struct {
      char log_level;
      std::string config_path;
      int64_t rpc_timeout, skew, poll_interval, reconcile_period, ttl,
          tick_interval, keepalive_interval;
    } raw;
    namespace po = boost::program_options;
    po::options_description desc("x402 facilitator options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("config", po::value(&raw.config_path), "read options from file");
    option("host",
           po::value(&config.host)->default_value("0.0.0.0"),
           "listen address");
    option("port,p", po::value(&config.port)->default_value(8080), "port");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("signer-key",
           po::value(&config.signer_key_path)->required(),
           "file with hex private key of the settlement account");
    option("rpc-timeout",
           po::value(&raw.rpc_timeout)->default_value(10),
           "JSON-RPC call timeout (seconds)");
    option("gas-limit",
           po::value(&config.gas_limit)->default_value(150000),
           "gas limit of settlement transactions");

    po::options_description rpc_desc("Chain endpoints");
    auto rpc_option{rpc_desc.add_options()};
    for (auto network : primitives::allNetworks()) {
      auto name{fmt::format("rpc.{}", primitives::networkName(network))};
      auto description{fmt::format("JSON-RPC url of {}", network)};
      rpc_option(name.c_str(), po::value<std::string>(), description.c_str());
    }
    desc.add(rpc_desc);

    po::options_description payment_desc("Verification and settlement");
    auto payment_option{payment_desc.add_options()};
    payment_option("skew",
                   po::value(&raw.skew)->default_value(6),
                   "accepted payer clock skew for validAfter (seconds)");
    payment_option("check-balance",
                   po::value(&config.check_balance)->default_value(false),
                   "verify payer token balance on chain");
    payment_option("poll-interval",
                   po::value(&raw.poll_interval)->default_value(1000),
                   "receipt polling interval (milliseconds)");
    payment_option("reconcile-period",
                   po::value(&raw.reconcile_period)->default_value(60),
                   "pending settlement reconciliation period (seconds)");
    desc.add(payment_desc);

    po::options_description stream_desc("Stream offer");
    auto stream_option{stream_desc.add_options()};
    stream_option("stream.enabled",
                  po::value(&config.stream_enabled)->default_value(true),
                  "serve payment streams on /stream");
    stream_option(
        "stream.network",
        po::value(&config.stream_network)
            ->default_value(Network::kBaseSepolia, "base-sepolia"),
        "network of stream payments");
    stream_option("stream.unit-seconds",
                  po::value(&config.unit_seconds)->default_value(60),
                  "seconds of content per slice");
    stream_option("stream.price",
                  po::value(&config.price_per_unit)->default_value("0.05"),
                  "USDC price per slice");
    stream_option(
        "stream.pay-to",
        po::value(&config.pay_to)->default_value(
            primitives::address::decodeFromString(
                "0xBAc675C310721717Cd4A37F6cbeA1F081b1C2a07")
                .value(),
            "0xBAc675C310721717Cd4A37F6cbeA1F081b1C2a07"),
        "seller address");
    stream_option(
        "stream.resource",
        po::value(&config.resource)->default_value("wss://example/stream"),
        "resource named in requirements");
    stream_option("stream.require-fraction",
                  po::value(&config.require_fraction)->default_value(0.5),
                  "point of the unit when next slice is required [0.3, 0.7]");
    stream_option("stream.ttl",
                  po::value(&raw.ttl)->default_value(30),
                  "seconds unpaid slice may stay due before pause");
    stream_option("stream.window-grace",
                  po::value(&config.window_grace)->default_value(10),
                  "allowed authorization window above unit (seconds)");
    stream_option("stream.tick",
                  po::value(&raw.tick_interval)->default_value(250),
                  "deadline check interval (milliseconds)");
    stream_option("stream.keepalive",
                  po::value(&raw.keepalive_interval)->default_value(5),
                  "keepalive interval (seconds), 0 disables");
    desc.add(stream_desc);

    po::variables_map vm;
    po::store(parse_command_line(argc, argv, desc), vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    if (vm.count("config") != 0) {
      raw.config_path = vm["config"].as<std::string>();
      std::ifstream config_file{raw.config_path};
      if (!config_file.good()) {
        std::cerr << "Config file " << raw.config_path << " can not be read."
                  << std::endl;
        exit(EXIT_FAILURE);
      }
      po::store(po::parse_config_file(config_file, desc), vm);
    }
    po::notify(vm);

    for (auto network : primitives::allNetworks()) {
      auto key{fmt::format("rpc.{}", primitives::networkName(network))};
      if (vm.count(key) != 0) {
        config.rpc_urls.emplace(network, vm[key].as<std::string>());
      }
    }
    config.rpc_timeout = std::chrono::seconds{raw.rpc_timeout};
    config.skew = std::chrono::seconds{raw.skew};
    config.poll_interval = std::chrono::milliseconds{raw.poll_interval};
    config.reconcile_period = std::chrono::seconds{raw.reconcile_period};
    config.ttl = std::chrono::seconds{raw.ttl};
    config.tick_interval = std::chrono::milliseconds{raw.tick_interval};
    config.keepalive_interval = std::chrono::seconds{raw.keepalive_interval};

    config.log_level = getLogLevel(raw.log_level);
    spdlog::set_level(config.log_level);

    if (config.require_fraction < 0.3 || config.require_fraction > 0.7) {
      std::cerr << "stream.require-fraction must be within [0.3, 0.7]"
                << std::endl;
      exit(EXIT_FAILURE);
    }
    if (config.window_grace > stream::kMaxWindowGrace) {
      std::cerr << "stream.window-grace must not exceed "
                << stream::kMaxWindowGrace << " seconds" << std::endl;
      exit(EXIT_FAILURE);
    }
    if (config.unit_seconds == 0 || config.tick_interval.count() <= 0
        || config.poll_interval.count() <= 0) {
      std::cerr << "Intervals must be positive" << std::endl;
      exit(EXIT_FAILURE);
    }
    if (config.ttl.count() <= 0
        || config.ttl.count()
               > config.unit_seconds * (1 - config.require_fraction)) {
      std::cerr << "stream.ttl must be positive and not exceed the part of "
                   "a unit after the next slice is required"
                << std::endl;
      exit(EXIT_FAILURE);
    }
    if (config.stream_enabled
        && config.rpc_urls.count(config.stream_network) == 0) {
      std::cerr << "Stream network "
                << primitives::networkName(config.stream_network)
                << " has no rpc endpoint" << std::endl;
      exit(EXIT_FAILURE);
    }

    return config;
  }
}  // namespace x402::node
