/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/gateway_configuration.hpp"

#include <iostream>

#include <boost/program_options.hpp>

namespace {
  template <typename T>
  std::optional<T> find_argument(boost::program_options::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      return it->second.as<T>();
    }
    return std::nullopt;
  }

  const size_t def_max_packed_messages = lpgate::gateway::kMaxBatchMessages;
  const size_t def_max_incoming_message_size =
      lpgate::gateway::kDefaultMaxIncomingMessageSize;
  const uint64_t def_defensive_weight =
      lpgate::gateway::kDefaultDefensiveWeight;
}  // namespace

namespace lpgate::application {

  GatewayConfiguration::GatewayConfiguration(log::Logger logger)
      : logger_{std::move(logger)} {
    gateway_config_.sender = primitives::LocalAddress{};
  }

  bool GatewayConfiguration::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax is `<target>=<level>`, e.g. -llpgate=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off.\n"
          "By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("input,i", po::value<std::string>(), "script to replay, standard input if omitted")
        ;

    po::options_description gateway_desc("Gateway options");
    gateway_desc.add_options()
        ("max-packed-messages", po::value<size_t>()->default_value(def_max_packed_messages), "max number of messages in an outbound batch")
        ("max-incoming-message-size", po::value<size_t>()->default_value(def_max_incoming_message_size), "max size of an inbound message in bytes")
        ("defensive-weight", po::value<uint64_t>()->default_value(def_defensive_weight), "weight charged per processed message")
        ("sender", po::value<std::string>(), "local account (0x-prefixed hex) outbound messages are sent from")
        ("routers", po::value<std::vector<std::string>>()->multitoken(), "router ids (0x-prefixed hex), the first one is primary")
        ("instance", po::value<std::vector<std::string>>()->multitoken(), "allowed remote instance as evm:<chain id>:0x<address>")
        ;
    // clang-format on

    desc.add(gateway_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    if (auto log = find_argument<std::vector<std::string>>(vm, "log")) {
      logger_tuning_config_ = std::move(*log);
    }
    if (auto input = find_argument<std::string>(vm, "input")) {
      input_path_ = *input;
    }

    gateway_config_.max_packed_messages =
        vm["max-packed-messages"].as<size_t>();
    gateway_config_.max_incoming_message_size =
        vm["max-incoming-message-size"].as<size_t>();
    gateway_config_.defensive_weight = vm["defensive-weight"].as<uint64_t>();

    if (auto sender = find_argument<std::string>(vm, "sender")) {
      auto account = primitives::AccountId::fromHexWithPrefix(*sender);
      if (account.has_error()) {
        SL_ERROR(logger_,
                 "Invalid --sender '{}': {}",
                 *sender,
                 account.error().message());
        return false;
      }
      gateway_config_.sender = primitives::LocalAddress{account.value()};
    }

    if (auto routers = find_argument<std::vector<std::string>>(vm, "routers")) {
      for (const auto &str : *routers) {
        auto router_id = gateway::RouterId::fromHexWithPrefix(str);
        if (router_id.has_error()) {
          SL_ERROR(logger_,
                   "Invalid router id '{}': {}",
                   str,
                   router_id.error().message());
          return false;
        }
        routers_.emplace_back(router_id.value());
      }
    }

    if (auto instances =
            find_argument<std::vector<std::string>>(vm, "instance")) {
      for (const auto &str : *instances) {
        auto instance = primitives::parseDomainAddress(str);
        if (instance.has_error()) {
          SL_ERROR(logger_,
                   "Invalid instance '{}': {}",
                   str,
                   instance.error().message());
          return false;
        }
        instances_.emplace_back(instance.value());
      }
    }

    if (gateway_config_.max_packed_messages == 0
        or gateway_config_.max_packed_messages > gateway::kMaxBatchMessages) {
      SL_ERROR(logger_,
               "--max-packed-messages must be in range 1..{}",
               gateway::kMaxBatchMessages);
      return false;
    }

    return true;
  }

}  // namespace lpgate::application
