/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/domain_address.hpp"

#include <charconv>

#include "common/visitor.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lpgate::primitives, AddressError, e) {
  using E = lpgate::primitives::AddressError;
  switch (e) {
    case E::INVALID_FORMAT:
      return "Address must be 'local:0x<account>' or 'evm:<chain>:0x<address>'";
    case E::INVALID_CHAIN_ID:
      return "Chain id is not a decimal 64-bit number";
  }
  return "Unknown AddressError";
}

namespace lpgate::primitives {

  namespace {
    constexpr uint8_t kLocalIndex = 0;
    constexpr uint8_t kEvmIndex = 1;

    constexpr std::string_view kLocalTag = "local";
    constexpr std::string_view kEvmTag = "evm";

    outcome::result<EvmChainId> parseChainId(std::string_view str) {
      EvmChainId chain_id = 0;
      auto [ptr, ec] =
          std::from_chars(str.data(), str.data() + str.size(), chain_id);
      if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return AddressError::INVALID_CHAIN_ID;
      }
      return chain_id;
    }
  }  // namespace

  outcome::result<Domain> parseDomain(std::string_view str) {
    if (str == kLocalTag) {
      return LocalDomain{};
    }
    auto colon = str.find(':');
    if (colon == std::string_view::npos or str.substr(0, colon) != kEvmTag) {
      return AddressError::INVALID_FORMAT;
    }
    OUTCOME_TRY(chain_id, parseChainId(str.substr(colon + 1)));
    return EvmDomain{chain_id};
  }

  outcome::result<DomainAddress> parseDomainAddress(std::string_view str) {
    auto colon = str.rfind(':');
    if (colon == std::string_view::npos) {
      return AddressError::INVALID_FORMAT;
    }
    auto domain_part = str.substr(0, colon);
    auto address_part = str.substr(colon + 1);

    if (domain_part == kLocalTag) {
      OUTCOME_TRY(account, AccountId::fromHexWithPrefix(address_part));
      return LocalAddress{account};
    }
    OUTCOME_TRY(domain, parseDomain(domain_part));
    auto evm = std::get_if<EvmDomain>(&domain);
    if (evm == nullptr) {
      return AddressError::INVALID_FORMAT;
    }
    OUTCOME_TRY(address, EvmAddress::fromHexWithPrefix(address_part));
    return EvmDomainAddress{evm->chain_id, address};
  }

  Domain domainOf(const DomainAddress &address) {
    return visit_in_place(
        address,
        [](const LocalAddress &) -> Domain { return LocalDomain{}; },
        [](const EvmDomainAddress &evm) -> Domain {
          return EvmDomain{evm.chain_id};
        });
  }

  bool isLocal(const Domain &domain) {
    return std::holds_alternative<LocalDomain>(domain);
  }

  void encode(const Domain &v, scale::Encoder &encoder) {
    visit_in_place(
        v,
        [&](const LocalDomain &) { encoder.put(kLocalIndex); },
        [&](const EvmDomain &evm) {
          encoder.put(kEvmIndex);
          encode(evm.chain_id, encoder);
        });
  }

  void decode(Domain &v, scale::Decoder &decoder) {
    switch (decoder.take()) {
      case kLocalIndex:
        v = LocalDomain{};
        return;
      case kEvmIndex: {
        EvmDomain evm;
        decode(evm.chain_id, decoder);
        v = evm;
        return;
      }
      default:
        scale::raise(scale::DecodeError::WRONG_TYPE_INDEX);
    }
  }

  void encode(const DomainAddress &v, scale::Encoder &encoder) {
    visit_in_place(
        v,
        [&](const LocalAddress &local) {
          encoder.put(kLocalIndex);
          encode(local.account, encoder);
        },
        [&](const EvmDomainAddress &evm) {
          encoder.put(kEvmIndex);
          encode(evm.chain_id, encoder);
          encode(evm.address, encoder);
        });
  }

  void decode(DomainAddress &v, scale::Decoder &decoder) {
    switch (decoder.take()) {
      case kLocalIndex: {
        LocalAddress local;
        decode(local.account, decoder);
        v = local;
        return;
      }
      case kEvmIndex: {
        EvmDomainAddress evm;
        decode(evm.chain_id, decoder);
        decode(evm.address, decoder);
        v = evm;
        return;
      }
      default:
        scale::raise(scale::DecodeError::WRONG_TYPE_INDEX);
    }
  }

}  // namespace lpgate::primitives
