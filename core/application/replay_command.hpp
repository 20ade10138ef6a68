/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "gateway/message.hpp"
#include "gateway/types.hpp"
#include "outcome/outcome.hpp"
#include "primitives/domain_address.hpp"

/**
 * Replay script: one command per line, arguments separated by spaces,
 * lines starting with '#' and empty lines are skipped.
 *
 *   set-routers <router id>...
 *   add-instance <domain address>
 *   remove-instance <domain address>
 *   receive <domain address> <router id> <encoded message>
 *   recover <domain address> <message proof> <router id>
 *   start-batch <account> <domain>
 *   send <account> <domain> <encoded message>
 *   end-batch <account> <domain>
 *   service [<max weight>]
 *   retry <nonce>
 *
 * Ids, accounts, proofs and messages are 0x-prefixed hex, domains and
 * addresses use the "local" / "evm:<chain id>" notation.
 */

namespace lpgate::application {

  enum class ReplayError : uint8_t {
    UNKNOWN_COMMAND = 1,
    WRONG_ARGUMENTS_NUMBER,
    INVALID_NUMBER,
  };

  namespace replay {
    struct SetRouters {
      std::vector<gateway::RouterId> router_ids;
    };

    struct AddInstance {
      primitives::DomainAddress instance;
    };

    struct RemoveInstance {
      primitives::DomainAddress instance;
    };

    struct Receive {
      primitives::DomainAddress origin;
      gateway::RouterId router_id;
      common::Buffer bytes;
    };

    struct Recover {
      primitives::DomainAddress origin;
      gateway::MessageProof proof;
      gateway::RouterId router_id;
    };

    struct StartBatch {
      primitives::AccountId sender;
      primitives::Domain destination;
    };

    struct Send {
      primitives::AccountId sender;
      primitives::Domain destination;
      gateway::Message message;
    };

    struct EndBatch {
      primitives::AccountId sender;
      primitives::Domain destination;
    };

    struct Service {
      std::optional<gateway::Weight> max_weight;
    };

    struct Retry {
      gateway::MessageNonce nonce = 0;
    };
  }  // namespace replay

  using ReplayCommand = std::variant<replay::SetRouters,
                                     replay::AddInstance,
                                     replay::RemoveInstance,
                                     replay::Receive,
                                     replay::Recover,
                                     replay::StartBatch,
                                     replay::Send,
                                     replay::EndBatch,
                                     replay::Service,
                                     replay::Retry>;

  /**
   * Parses one script line
   * @return std::nullopt for blank and comment lines
   */
  outcome::result<std::optional<ReplayCommand>> parseReplayCommand(
      std::string_view line);

}  // namespace lpgate::application

OUTCOME_HPP_DECLARE_ERROR(lpgate::application, ReplayError);
