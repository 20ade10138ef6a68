/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace lpgate::log {

  /**
   * Logging configurator with the embedded default group tree of the
   * gateway. An explicit YAML string or file overrides it.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    Configurator(std::shared_ptr<PrevConfigurator> previous);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::string config);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::filesystem::path path);
  };

}  // namespace lpgate::log
