/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <variant>
#include <vector>

#include "gateway/message.hpp"
#include "gateway/types.hpp"
#include "outcome/outcome.hpp"
#include "primitives/domain_address.hpp"

namespace lpgate::gateway {

  /// Full message received from the primary router
  struct MessageEntry {
    SessionId session_id = 0;
    primitives::DomainAddress domain_address;
    Message message;
    /// Grows by the expected proof count of the router set every time an
    /// identical message arrives
    uint32_t expected_proof_count = 0;

    bool operator==(const MessageEntry &) const = default;

    friend void encode(const MessageEntry &v, scale::Encoder &encoder) {
      encode(v.session_id, encoder);
      encode(v.domain_address, encoder);
      encode(v.message, encoder);
      encode(v.expected_proof_count, encoder);
    }

    friend void decode(MessageEntry &v, scale::Decoder &decoder) {
      decode(v.session_id, decoder);
      decode(v.domain_address, decoder);
      decode(v.message, decoder);
      decode(v.expected_proof_count, decoder);
    }
  };

  /// Proofs received from one of the secondary routers
  struct ProofEntry {
    SessionId session_id = 0;
    uint32_t current_count = 0;

    bool operator==(const ProofEntry &) const = default;

    /// Session matches and at least one proof is not consumed yet
    bool hasValidVoteForSession(SessionId session) const {
      return session_id == session and current_count > 0;
    }

    friend void encode(const ProofEntry &v, scale::Encoder &encoder) {
      encode(v.session_id, encoder);
      encode(v.current_count, encoder);
    }

    friend void decode(ProofEntry &v, scale::Decoder &decoder) {
      decode(v.session_id, decoder);
      decode(v.current_count, decoder);
    }
  };

  /// Pending state of one message as seen through one router
  using InboundEntry = std::variant<MessageEntry, ProofEntry>;

  /// Router setup an inbound message is processed against
  struct InboundProcessingInfo {
    primitives::DomainAddress domain_address;
    std::vector<RouterId> router_ids;
    SessionId current_session_id = 0;
    uint32_t expected_proof_count_per_message = 0;
  };

  SessionId sessionIdOf(const InboundEntry &entry);

  /// Entry a freshly arrived sub-message would create
  InboundEntry makeInboundEntry(const InboundProcessingInfo &info,
                                const Message &submessage);

  /**
   * Checks that the router is configured, and that only the first router
   * sends full messages while the rest send proofs
   */
  outcome::result<void> validateInboundEntry(const InboundEntry &entry,
                                             const InboundProcessingInfo &info,
                                             const RouterId &router_id);

  /**
   * Merges `candidate` into the stored entry. Counts of the same session
   * are added up, an entry of another session is replaced
   */
  outcome::result<void> preDispatchUpdate(InboundEntry &stored,
                                          InboundEntry candidate);

  /**
   * Proof entry gets one more proof, or is restarted with a single proof
   * when the session changed
   */
  outcome::result<void> incrementProofCount(InboundEntry &entry,
                                            SessionId session_id);

  /**
   * Entry left after one message was executed, std::nullopt when it is
   * exhausted or belongs to a stale session
   */
  outcome::result<std::optional<InboundEntry>> createPostVotingEntry(
      const InboundEntry &entry, const InboundProcessingInfo &info);

}  // namespace lpgate::gateway
