/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/quorum_engine.hpp"

#include <boost/assert.hpp>

#include "gateway/gateway_error.hpp"
#include "gateway/weight.hpp"
#include "primitives/math.hpp"

namespace lpgate::gateway {

  QuorumEngine::QuorumEngine(
      std::shared_ptr<RouterRegistry> routers,
      std::shared_ptr<GatewayStorage> storage,
      std::shared_ptr<storage::TransactionalStorage> transactions,
      std::shared_ptr<InboundMessageHandler> handler,
      Weight defensive_weight)
      : routers_{std::move(routers)},
        storage_{std::move(storage)},
        transactions_{std::move(transactions)},
        handler_{std::move(handler)},
        defensive_weight_{defensive_weight},
        logger_{log::createLogger("QuorumEngine", "quorum")} {
    BOOST_ASSERT(routers_ != nullptr);
    BOOST_ASSERT(storage_ != nullptr);
    BOOST_ASSERT(transactions_ != nullptr);
    BOOST_ASSERT(handler_ != nullptr);
  }

  outcome::result<InboundProcessingInfo> QuorumEngine::processingInfo(
      const primitives::DomainAddress &domain_address) const {
    OUTCOME_TRY(router_ids,
                routers_->routerIdsForDomain(primitives::domainOf(domain_address)));
    OUTCOME_TRY(session_id, routers_->sessionId());
    OUTCOME_TRY(expected, RouterRegistry::expectedProofCount(router_ids));
    return InboundProcessingInfo{
        .domain_address = domain_address,
        .router_ids = std::move(router_ids),
        .current_session_id = session_id,
        .expected_proof_count_per_message = expected,
    };
  }

  ProcessResult QuorumEngine::process(
      const primitives::DomainAddress &domain_address,
      const Message &message,
      const RouterId &router_id) {
    auto info_res = processingInfo(domain_address);
    if (info_res.has_error()) {
      SL_DEBUG(logger_,
               "Inbound message from {} rejected: {}",
               domain_address,
               info_res.error().message());
      return {.result = info_res.as_failure(), .weight = defensive_weight_};
    }
    const auto &info = info_res.value();

    size_t count = 0;
    for (const auto &submessage : message.submessages()) {
      ++count;
      auto res = storage::withTransaction(
          *transactions_, [&]() -> outcome::result<void> {
            return processSubmessage(info, submessage, router_id);
          });
      if (res.has_error()) {
        SL_DEBUG(logger_,
                 "Sub-message #{} of {} via router {} failed: {}",
                 count,
                 submessage,
                 router_id,
                 res.error().message());
        return {
            .result = res.as_failure(),
            .weight = processingWeight(defensive_weight_, count),
        };
      }
    }

    return {
        .result = outcome::success(),
        .weight = processingWeight(defensive_weight_, count),
    };
  }

  outcome::result<void> QuorumEngine::processSubmessage(
      const InboundProcessingInfo &info,
      const Message &submessage,
      const RouterId &router_id) {
    auto carried = submessage.proofHash();
    const MessageProof proof =
        carried.has_value() ? carried.value() : submessage.hash();

    auto candidate = makeInboundEntry(info, submessage);
    OUTCOME_TRY(validateInboundEntry(candidate, info, router_id));
    OUTCOME_TRY(upsertPendingEntry(proof, router_id, std::move(candidate)));

    return executeIfRequirementsAreMet(info, proof);
  }

  outcome::result<void> QuorumEngine::upsertPendingEntry(
      const MessageProof &proof,
      const RouterId &router_id,
      InboundEntry candidate) {
    OUTCOME_TRY(stored, storage_->getInboundEntry(proof, router_id));
    if (not stored.has_value()) {
      return storage_->putInboundEntry(proof, router_id, candidate);
    }
    InboundEntry entry = std::move(stored.value());
    OUTCOME_TRY(preDispatchUpdate(entry, std::move(candidate)));
    return storage_->putInboundEntry(proof, router_id, entry);
  }

  outcome::result<void> QuorumEngine::executeIfRequirementsAreMet(
      const InboundProcessingInfo &info, const MessageProof &proof) {
    std::optional<Message> message;
    uint32_t votes = 0;

    for (const auto &router_id : info.router_ids) {
      OUTCOME_TRY(stored, storage_->getInboundEntry(proof, router_id));
      // one entry per router is required
      if (not stored.has_value()) {
        return outcome::success();
      }
      // the first router can't hold a vote of the current session, so with
      // enough votes the only message entry left is the first router's one
      if (auto message_entry = std::get_if<MessageEntry>(&stored.value())) {
        message = message_entry->message;
      } else if (std::get<ProofEntry>(stored.value())
                     .hasValidVoteForSession(info.current_session_id)) {
        OUTCOME_TRY(math::checked_add(votes, uint32_t{1}));
      }
    }

    if (votes < info.expected_proof_count_per_message) {
      SL_TRACE(logger_,
               "Message {} has {} of {} proofs",
               proof,
               votes,
               info.expected_proof_count_per_message);
      return outcome::success();
    }
    if (not message.has_value()) {
      return outcome::success();
    }

    OUTCOME_TRY(executePostVotingDispatch(info, proof));

    SL_VERBOSE(logger_,
               "Execute message {} from {}",
               proof,
               info.domain_address);
    return handler_->handle(info.domain_address, message.value());
  }

  outcome::result<void> QuorumEngine::executePostVotingDispatch(
      const InboundProcessingInfo &info, const MessageProof &proof) {
    for (const auto &router_id : info.router_ids) {
      OUTCOME_TRY(stored, storage_->getInboundEntry(proof, router_id));
      if (not stored.has_value()) {
        return GatewayError::PendingInboundEntryNotFound;
      }
      OUTCOME_TRY(updated, createPostVotingEntry(stored.value(), info));
      if (updated.has_value()) {
        OUTCOME_TRY(storage_->putInboundEntry(proof, router_id, updated.value()));
      } else {
        OUTCOME_TRY(storage_->removeInboundEntry(proof, router_id));
      }
    }
    return outcome::success();
  }

  outcome::result<void> QuorumEngine::executeMessageRecovery(
      const primitives::DomainAddress &domain_address,
      const MessageProof &proof,
      const RouterId &router_id) {
    return storage::withTransaction(
        *transactions_, [&]() -> outcome::result<void> {
          OUTCOME_TRY(info, processingInfo(domain_address));
          if (info.router_ids.size() < 2) {
            return GatewayError::NotEnoughRoutersForDomain;
          }

          InboundEntry candidate = ProofEntry{
              .session_id = info.current_session_id,
              .current_count = 1,
          };
          OUTCOME_TRY(validateInboundEntry(candidate, info, router_id));

          OUTCOME_TRY(stored, storage_->getInboundEntry(proof, router_id));
          if (stored.has_value()) {
            InboundEntry entry = std::move(stored.value());
            OUTCOME_TRY(incrementProofCount(entry, info.current_session_id));
            OUTCOME_TRY(storage_->putInboundEntry(proof, router_id, entry));
          } else {
            OUTCOME_TRY(storage_->putInboundEntry(proof, router_id, candidate));
          }

          SL_INFO(logger_,
                  "Recovered proof {} of router {}",
                  proof,
                  router_id);
          return executeIfRequirementsAreMet(info, proof);
        });
  }

}  // namespace lpgate::gateway
