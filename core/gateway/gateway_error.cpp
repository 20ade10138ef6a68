/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/gateway_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lpgate::gateway, GatewayError, e) {
  using E = lpgate::gateway::GatewayError;
  switch (e) {
    case E::NotEnoughRoutersForDomain:
      return "Not enough routers are configured for the domain";
    case E::UnknownRouter:
      return "Router is not configured";
    case E::DomainNotSupported:
      return "Domain is not supported";
    case E::InstanceAlreadyAdded:
      return "Instance was already added";
    case E::UnknownInstance:
      return "Unknown instance";
    case E::InvalidMessageOrigin:
      return "Invalid message origin";
    case E::MessageDecodingFailed:
      return "Message decoding failed";
    case E::MessageExpectedFromFirstRouter:
      return "Message must be sent by the first router";
    case E::ProofNotExpectedFromFirstRouter:
      return "Proof must not be sent by the first router";
    case E::ExpectedMessageType:
      return "Stored entry is a message, but a proof was received";
    case E::ExpectedMessageProofType:
      return "Stored entry is a proof, but a message was received";
    case E::PendingInboundEntryNotFound:
      return "Pending inbound entry not found";
    case E::MessagePackingAlreadyStarted:
      return "Message packing was already started";
    case E::MessagePackingNotStarted:
      return "Message packing was not started";
    case E::DuplicateRouter:
      return "Router list contains duplicates";
  }
  return "Unknown GatewayError";
}
