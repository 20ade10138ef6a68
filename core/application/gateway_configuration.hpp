/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "gateway/gateway_config.hpp"
#include "gateway/types.hpp"
#include "log/logger.hpp"
#include "primitives/domain_address.hpp"

namespace lpgate::application {

  /**
   * Settings of the replay tool, read from the command line
   */
  class GatewayConfiguration {
   public:
    explicit GatewayConfiguration(log::Logger logger);

    /**
     * Parses the arguments
     * @return false if the tool should not run: on errors and on --help
     */
    bool initializeFromArgs(int argc, const char **argv);

    const gateway::GatewayConfig &gatewayConfig() const {
      return gateway_config_;
    }

    /// Routers to set up before replaying, in priority order
    const std::vector<gateway::RouterId> &routers() const {
      return routers_;
    }

    /// Remote instances allowed before replaying
    const std::vector<primitives::DomainAddress> &instances() const {
      return instances_;
    }

    /// Script to replay, standard input if not set
    const std::optional<std::filesystem::path> &inputPath() const {
      return input_path_;
    }

    /// Logging tuning in the form "[group=]level"
    const std::vector<std::string> &log() const {
      return logger_tuning_config_;
    }

   private:
    log::Logger logger_;

    gateway::GatewayConfig gateway_config_;
    std::vector<gateway::RouterId> routers_;
    std::vector<primitives::DomainAddress> instances_;
    std::optional<std::filesystem::path> input_path_;
    std::vector<std::string> logger_tuning_config_;
  };

}  // namespace lpgate::application
