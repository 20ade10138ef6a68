/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

#include <fmt/format.h>
#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "outcome/outcome.hpp"

LPGATE_BLOB_STRICT_TYPEDEF(lpgate::primitives, AccountId, 32);
LPGATE_BLOB_STRICT_TYPEDEF(lpgate::primitives, EvmAddress, 20);

namespace lpgate::primitives {

  using EvmChainId = uint64_t;

  /// The chain the gateway itself runs on
  struct LocalDomain {
    bool operator==(const LocalDomain &) const = default;
  };

  /// A remote EVM chain
  struct EvmDomain {
    EvmChainId chain_id = 0;

    bool operator==(const EvmDomain &) const = default;
  };

  using Domain = std::variant<LocalDomain, EvmDomain>;

  /// An account of the local chain
  struct LocalAddress {
    AccountId account;

    bool operator==(const LocalAddress &) const = default;
  };

  /// A contract or account on a remote EVM chain
  struct EvmDomainAddress {
    EvmChainId chain_id = 0;
    EvmAddress address;

    bool operator==(const EvmDomainAddress &) const = default;
  };

  using DomainAddress = std::variant<LocalAddress, EvmDomainAddress>;

  /// Domain the address belongs to
  Domain domainOf(const DomainAddress &address);

  bool isLocal(const Domain &domain);

  inline bool isLocal(const DomainAddress &address) {
    return isLocal(domainOf(address));
  }

  enum class AddressError : uint8_t {
    INVALID_FORMAT = 1,
    INVALID_CHAIN_ID,
  };

  /// Parses "local" or "evm:<chain id>"
  outcome::result<Domain> parseDomain(std::string_view str);

  /// Parses "local:0x<32 bytes hex>" or "evm:<chain id>:0x<20 bytes hex>"
  outcome::result<DomainAddress> parseDomainAddress(std::string_view str);

  void encode(const Domain &v, scale::Encoder &encoder);
  void decode(Domain &v, scale::Decoder &decoder);

  void encode(const DomainAddress &v, scale::Encoder &encoder);
  void decode(DomainAddress &v, scale::Decoder &decoder);

}  // namespace lpgate::primitives

OUTCOME_HPP_DECLARE_ERROR(lpgate::primitives, AddressError);

template <>
struct fmt::formatter<lpgate::primitives::Domain> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const lpgate::primitives::Domain &domain,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    if (auto evm = std::get_if<lpgate::primitives::EvmDomain>(&domain)) {
      return fmt::format_to(ctx.out(), "evm:{}", evm->chain_id);
    }
    return fmt::format_to(ctx.out(), "local");
  }
};

template <>
struct fmt::formatter<lpgate::primitives::DomainAddress> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const lpgate::primitives::DomainAddress &address,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    if (auto evm =
            std::get_if<lpgate::primitives::EvmDomainAddress>(&address)) {
      return fmt::format_to(
          ctx.out(), "evm:{}:0x{}", evm->chain_id, evm->address.toHex());
    }
    return fmt::format_to(
        ctx.out(),
        "local:0x{}",
        std::get<lpgate::primitives::LocalAddress>(address).account.toHex());
  }
};
