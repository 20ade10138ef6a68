/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/message.hpp"

#include "common/visitor.hpp"
#include "crypto/sha/sha256.hpp"

namespace lpgate::gateway {

  namespace {
    constexpr uint8_t kSimpleIndex = 0;
    constexpr uint8_t kProofIndex = 1;
    constexpr uint8_t kBatchIndex = 2;
  }  // namespace

  void encode(const Message &v, scale::Encoder &encoder) {
    visit_in_place(
        v.content,
        [&](const SimpleMessage &simple) {
          encoder.put(kSimpleIndex);
          encode(simple.payload, encoder);
        },
        [&](const ProofMessage &proof) {
          encoder.put(kProofIndex);
          encode(proof.hash, encoder);
        },
        [&](const BatchMessage &batch) {
          encoder.put(kBatchIndex);
          encode(batch.submessages, encoder);
        });
  }

  void decode(Message &v, scale::Decoder &decoder) {
    switch (decoder.take()) {
      case kSimpleIndex: {
        SimpleMessage simple;
        decode(simple.payload, decoder);
        v.content = std::move(simple);
        return;
      }
      case kProofIndex: {
        ProofMessage proof;
        decode(proof.hash, decoder);
        v.content = proof;
        return;
      }
      case kBatchIndex: {
        size_t count = 0;
        decode(scale::as_compact(count), decoder);
        if (count > kMaxBatchMessages) {
          scale::raise(scale::DecodeError::TOO_MANY_ITEMS);
        }
        BatchMessage batch;
        batch.submessages.resize(count);
        for (auto &submessage : batch.submessages) {
          decode(submessage, decoder);
          if (submessage.isBatch()) {
            scale::raise(scale::DecodeError::UNEXPECTED_VALUE);
          }
        }
        v.content = std::move(batch);
        return;
      }
      default:
        scale::raise(scale::DecodeError::WRONG_TYPE_INDEX);
    }
  }

  Message Message::empty() {
    return BatchMessage{};
  }

  outcome::result<Message> Message::deserialize(common::BufferView bytes) {
    auto res = scale::decode<Message>(bytes);
    if (res.has_error()) {
      return MessageError::DecodingFailed;
    }
    return std::move(res.value());
  }

  common::Buffer Message::serialize() const {
    return scale::encode(*this).value();
  }

  std::optional<MessageProof> Message::proofHash() const {
    if (auto proof = std::get_if<ProofMessage>(&content)) {
      return proof->hash;
    }
    return std::nullopt;
  }

  MessageProof Message::hash() const {
    return MessageProof{crypto::sha256(serialize())};
  }

  Message Message::toProofMessage() const {
    if (auto batch = std::get_if<BatchMessage>(&content)) {
      BatchMessage proofs;
      proofs.submessages.reserve(batch->submessages.size());
      for (auto &submessage : batch->submessages) {
        proofs.submessages.emplace_back(ProofMessage{submessage.hash()});
      }
      return proofs;
    }
    return ProofMessage{hash()};
  }

  std::vector<Message> Message::submessages() const {
    if (auto batch = std::get_if<BatchMessage>(&content)) {
      return batch->submessages;
    }
    return {*this};
  }

  outcome::result<void> Message::packWith(Message other, size_t limit) {
    if (other.isBatch()) {
      return MessageError::NestedBatch;
    }
    if (auto batch = std::get_if<BatchMessage>(&content)) {
      if (batch->submessages.size() >= limit) {
        return MessageError::BatchLimitReached;
      }
      batch->submessages.emplace_back(std::move(other));
      return outcome::success();
    }
    if (limit < 2) {
      return MessageError::BatchLimitReached;
    }
    BatchMessage packed;
    packed.submessages.emplace_back(std::move(*this));
    packed.submessages.emplace_back(std::move(other));
    content = std::move(packed);
    return outcome::success();
  }

}  // namespace lpgate::gateway
