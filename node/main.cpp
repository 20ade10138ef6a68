/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <fstream>
#include <iostream>

#include <libp2p/log/configurator.hpp>

#include "application/gateway_configuration.hpp"
#include "application/replay_application.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

int main(int argc, const char **argv) {
  auto logging_system = [] {
    auto libp2p_log_configurator =
        std::make_shared<libp2p::log::Configurator>();

    auto lpgate_log_configurator = std::make_shared<lpgate::log::Configurator>(
        std::move(libp2p_log_configurator));

    return std::make_shared<soralog::LoggingSystem>(
        std::move(lpgate_log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  lpgate::log::setLoggingSystem(logging_system);

  auto logger = lpgate::log::createLogger("Main", "application");

  lpgate::application::GatewayConfiguration configuration(logger);
  if (not configuration.initializeFromArgs(argc, argv)) {
    return EXIT_FAILURE;
  }

  lpgate::log::tuneLoggingSystem(configuration.log());

  lpgate::application::ReplayApplication app(configuration);

  if (const auto &path = configuration.inputPath(); path.has_value()) {
    std::ifstream input(path.value());
    if (not input) {
      SL_ERROR(logger, "Can not open script {}", path.value().string());
      return EXIT_FAILURE;
    }
    return app.run(input);
  }
  return app.run(std::cin);
}
