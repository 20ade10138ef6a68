/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <variant>
#include <vector>

#include <scale/scale.hpp>

#include "common/buffer.hpp"
#include "gateway/message_error.hpp"
#include "gateway/types.hpp"

namespace lpgate::gateway {

  /// Max number of sub-messages a batch can hold
  constexpr size_t kMaxBatchMessages = 16;

  struct Message;

  /// Opaque payload, interpreted by the inbound handler only
  struct SimpleMessage {
    common::Buffer payload;

    bool operator==(const SimpleMessage &) const = default;
  };

  /// Confirmation of a message sent through another router
  struct ProofMessage {
    MessageProof hash;

    bool operator==(const ProofMessage &) const = default;
  };

  /// Several messages delivered as one. Never contains another batch
  struct BatchMessage {
    std::vector<Message> submessages;

    bool operator==(const BatchMessage &other) const;
  };

  /**
   * Gateway level message. Encoded as SCALE variant with indices 0 (simple),
   * 1 (proof) and 2 (batch)
   */
  struct Message {
    using Content = std::variant<SimpleMessage, ProofMessage, BatchMessage>;

    Message() = default;
    Message(SimpleMessage simple) : content{std::move(simple)} {}
    Message(ProofMessage proof) : content{std::move(proof)} {}
    Message(BatchMessage batch) : content{std::move(batch)} {}

    bool operator==(const Message &) const = default;

    /// Empty batch, used to start packing
    static Message empty();

    static outcome::result<Message> deserialize(common::BufferView bytes);

    common::Buffer serialize() const;

    bool isProof() const {
      return std::holds_alternative<ProofMessage>(content);
    }

    bool isBatch() const {
      return std::holds_alternative<BatchMessage>(content);
    }

    /// Hash carried by a proof message
    std::optional<MessageProof> proofHash() const;

    /// Hash of the encoded message, which identifies it among its proofs
    MessageProof hash() const;

    /**
     * Message sent by the non-primary routers. For a batch it is a batch of
     * proofs of every sub-message
     */
    Message toProofMessage() const;

    /// Messages a batch consists of, or the message itself
    std::vector<Message> submessages() const;

    /**
     * Appends `other` turning this message into a batch if needed
     * @param limit max number of sub-messages after packing
     */
    outcome::result<void> packWith(Message other,
                                   size_t limit = kMaxBatchMessages);

    friend void encode(const Message &v, scale::Encoder &encoder);
    friend void decode(Message &v, scale::Decoder &decoder);

    Content content;
  };

  inline bool BatchMessage::operator==(const BatchMessage &other) const {
    return submessages == other.submessages;
  }

}  // namespace lpgate::gateway

template <>
struct fmt::formatter<lpgate::gateway::Message> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const lpgate::gateway::Message &message,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    using namespace lpgate::gateway;
    if (auto simple = std::get_if<SimpleMessage>(&message.content)) {
      return fmt::format_to(
          ctx.out(), "Simple({} bytes)", simple->payload.size());
    }
    if (auto proof = std::get_if<ProofMessage>(&message.content)) {
      return fmt::format_to(ctx.out(), "Proof({})", proof->hash);
    }
    return fmt::format_to(
        ctx.out(),
        "Batch({} messages)",
        std::get<BatchMessage>(message.content).submessages.size());
  }
};
