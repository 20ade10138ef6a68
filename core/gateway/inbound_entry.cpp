/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/inbound_entry.hpp"

#include <algorithm>

#include "common/visitor.hpp"
#include "gateway/gateway_error.hpp"
#include "primitives/math.hpp"

namespace lpgate::gateway {

  SessionId sessionIdOf(const InboundEntry &entry) {
    return visit_in_place(
        entry,
        [](const MessageEntry &message) { return message.session_id; },
        [](const ProofEntry &proof) { return proof.session_id; });
  }

  InboundEntry makeInboundEntry(const InboundProcessingInfo &info,
                                const Message &submessage) {
    if (submessage.isProof()) {
      return ProofEntry{
          .session_id = info.current_session_id,
          .current_count = 1,
      };
    }
    return MessageEntry{
        .session_id = info.current_session_id,
        .domain_address = info.domain_address,
        .message = submessage,
        .expected_proof_count = info.expected_proof_count_per_message,
    };
  }

  outcome::result<void> validateInboundEntry(const InboundEntry &entry,
                                             const InboundProcessingInfo &info,
                                             const RouterId &router_id) {
    const auto &routers = info.router_ids;
    if (std::find(routers.begin(), routers.end(), router_id) == routers.end()) {
      return GatewayError::UnknownRouter;
    }
    const bool is_first = routers.front() == router_id;
    if (is_type<MessageEntry>(entry)) {
      if (not is_first) {
        return GatewayError::MessageExpectedFromFirstRouter;
      }
    } else if (is_first) {
      return GatewayError::ProofNotExpectedFromFirstRouter;
    }
    return outcome::success();
  }

  outcome::result<void> preDispatchUpdate(InboundEntry &stored,
                                          InboundEntry candidate) {
    if (auto message = std::get_if<MessageEntry>(&stored)) {
      auto other = std::get_if<MessageEntry>(&candidate);
      if (other == nullptr) {
        return GatewayError::ExpectedMessageType;
      }
      if (message->session_id != other->session_id) {
        stored = std::move(candidate);
        return outcome::success();
      }
      return math::checked_add(message->expected_proof_count,
                               other->expected_proof_count);
    }

    auto &proof = std::get<ProofEntry>(stored);
    auto other = std::get_if<ProofEntry>(&candidate);
    if (other == nullptr) {
      return GatewayError::ExpectedMessageProofType;
    }
    if (proof.session_id != other->session_id) {
      stored = std::move(candidate);
      return outcome::success();
    }
    return math::checked_add(proof.current_count, other->current_count);
  }

  outcome::result<void> incrementProofCount(InboundEntry &entry,
                                            SessionId session_id) {
    auto proof = std::get_if<ProofEntry>(&entry);
    if (proof == nullptr) {
      return GatewayError::ExpectedMessageProofType;
    }
    if (proof->session_id != session_id) {
      proof->session_id = session_id;
      proof->current_count = 1;
      return outcome::success();
    }
    return math::checked_add(proof->current_count, uint32_t{1});
  }

  outcome::result<std::optional<InboundEntry>> createPostVotingEntry(
      const InboundEntry &entry, const InboundProcessingInfo &info) {
    if (sessionIdOf(entry) != info.current_session_id) {
      return std::nullopt;
    }

    if (auto message = std::get_if<MessageEntry>(&entry)) {
      auto count = message->expected_proof_count;
      OUTCOME_TRY(
          math::checked_sub(count, info.expected_proof_count_per_message));
      if (count == 0) {
        return std::nullopt;
      }
      auto updated = *message;
      updated.expected_proof_count = count;
      return InboundEntry{std::move(updated)};
    }

    auto count = std::get<ProofEntry>(entry).current_count;
    OUTCOME_TRY(math::checked_sub(count, uint32_t{1}));
    if (count == 0) {
      return std::nullopt;
    }
    return InboundEntry{ProofEntry{info.current_session_id, count}};
  }

}  // namespace lpgate::gateway
