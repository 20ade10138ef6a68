/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/replay_command.hpp"

#include <charconv>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "common/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lpgate::application, ReplayError, e) {
  using E = lpgate::application::ReplayError;
  switch (e) {
    case E::UNKNOWN_COMMAND:
      return "Unknown replay command";
    case E::WRONG_ARGUMENTS_NUMBER:
      return "Wrong number of command arguments";
    case E::INVALID_NUMBER:
      return "Argument is not a decimal number";
  }
  return "Unknown ReplayError";
}

namespace lpgate::application {

  namespace {
    using Args = std::vector<std::string>;

    outcome::result<uint64_t> parseNumber(std::string_view str) {
      uint64_t value = 0;
      auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
      if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return ReplayError::INVALID_NUMBER;
      }
      return value;
    }

    outcome::result<void> expectArgs(const Args &args, size_t count) {
      // first token is the command itself
      if (args.size() != count + 1) {
        return ReplayError::WRONG_ARGUMENTS_NUMBER;
      }
      return outcome::success();
    }

    outcome::result<std::pair<primitives::AccountId, primitives::Domain>>
    parseSenderAndDomain(const Args &args) {
      OUTCOME_TRY(sender, primitives::AccountId::fromHexWithPrefix(args[1]));
      OUTCOME_TRY(domain, primitives::parseDomain(args[2]));
      return std::make_pair(sender, domain);
    }
  }  // namespace

  outcome::result<std::optional<ReplayCommand>> parseReplayCommand(
      std::string_view line) {
    std::string trimmed = boost::algorithm::trim_copy(std::string{line});
    if (trimmed.empty() or trimmed.front() == '#') {
      return std::nullopt;
    }

    Args args;
    boost::algorithm::split(args,
                            trimmed,
                            boost::algorithm::is_space(),
                            boost::algorithm::token_compress_on);
    const auto &command = args.front();

    if (command == "set-routers") {
      replay::SetRouters cmd;
      for (size_t i = 1; i < args.size(); ++i) {
        OUTCOME_TRY(router_id, gateway::RouterId::fromHexWithPrefix(args[i]));
        cmd.router_ids.emplace_back(router_id);
      }
      return cmd;
    }
    if (command == "add-instance" or command == "remove-instance") {
      OUTCOME_TRY(expectArgs(args, 1));
      OUTCOME_TRY(instance, primitives::parseDomainAddress(args[1]));
      if (command == "add-instance") {
        return replay::AddInstance{instance};
      }
      return replay::RemoveInstance{instance};
    }
    if (command == "receive") {
      OUTCOME_TRY(expectArgs(args, 3));
      OUTCOME_TRY(origin, primitives::parseDomainAddress(args[1]));
      OUTCOME_TRY(router_id, gateway::RouterId::fromHexWithPrefix(args[2]));
      OUTCOME_TRY(bytes, common::unhexWith0x(args[3]));
      return replay::Receive{origin, router_id, std::move(bytes)};
    }
    if (command == "recover") {
      OUTCOME_TRY(expectArgs(args, 3));
      OUTCOME_TRY(origin, primitives::parseDomainAddress(args[1]));
      OUTCOME_TRY(proof, gateway::MessageProof::fromHexWithPrefix(args[2]));
      OUTCOME_TRY(router_id, gateway::RouterId::fromHexWithPrefix(args[3]));
      return replay::Recover{origin, proof, router_id};
    }
    if (command == "start-batch" or command == "end-batch") {
      OUTCOME_TRY(expectArgs(args, 2));
      OUTCOME_TRY(target, parseSenderAndDomain(args));
      if (command == "start-batch") {
        return replay::StartBatch{target.first, target.second};
      }
      return replay::EndBatch{target.first, target.second};
    }
    if (command == "send") {
      OUTCOME_TRY(expectArgs(args, 3));
      OUTCOME_TRY(target, parseSenderAndDomain(args));
      OUTCOME_TRY(bytes, common::unhexWith0x(args[3]));
      OUTCOME_TRY(message, gateway::Message::deserialize(bytes));
      return replay::Send{target.first, target.second, std::move(message)};
    }
    if (command == "service") {
      if (args.size() == 1) {
        return replay::Service{};
      }
      OUTCOME_TRY(expectArgs(args, 1));
      OUTCOME_TRY(max_weight, parseNumber(args[1]));
      return replay::Service{max_weight};
    }
    if (command == "retry") {
      OUTCOME_TRY(expectArgs(args, 1));
      OUTCOME_TRY(nonce, parseNumber(args[1]));
      return replay::Retry{nonce};
    }
    return ReplayError::UNKNOWN_COMMAND;
  }

}  // namespace lpgate::application
