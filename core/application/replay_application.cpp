/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/replay_application.hpp"

#include <cstdlib>
#include <limits>
#include <string>

#include "application/impl/logging_inbound_handler.hpp"
#include "application/impl/logging_message_sender.hpp"
#include "common/visitor.hpp"
#include "gateway/impl/gateway_storage_impl.hpp"
#include "gateway/liquidity_pools_gateway.hpp"
#include "gateway/queue/gateway_queue.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/transactional_storage.hpp"

namespace lpgate::application {

  namespace {
    const primitives::Origin kRoot = primitives::RootOrigin{};
  }

  ReplayApplication::ReplayApplication(const GatewayConfiguration &config)
      : config_{config},
        gateway_events_{std::make_shared<gateway::GatewayEventEmitter>()},
        queue_events_{std::make_shared<gateway::QueueEventEmitter>()},
        storage_{std::make_shared<storage::TransactionalStorage>(
            std::make_shared<storage::InMemoryStorage>())},
        handler_{std::make_shared<LoggingInboundHandler>()},
        sender_{std::make_shared<LoggingMessageSender>()},
        queue_{std::make_shared<gateway::GatewayQueue>(queue_events_)},
        logger_{log::createLogger("Replay", "application")} {
    const auto &gateway_config = config_.gatewayConfig();

    auto gateway_storage =
        std::make_shared<gateway::GatewayStorageImpl>(storage_);
    auto routers = std::make_shared<gateway::RouterRegistry>(gateway_storage,
                                                             gateway_events_);
    auto quorum =
        std::make_shared<gateway::QuorumEngine>(routers,
                                                gateway_storage,
                                                storage_,
                                                handler_,
                                                gateway_config.defensive_weight);
    auto batcher = std::make_shared<gateway::OutboundBatcher>(
        gateway_storage, gateway_config.max_packed_messages);

    gateway_ = std::make_shared<gateway::LiquidityPoolsGateway>(
        gateway_config,
        gateway_storage,
        routers,
        quorum,
        batcher,
        queue_,
        sender_,
        std::make_shared<gateway::EnsureRoot>(),
        gateway_events_);
    queue_->setProcessor(gateway_);

    gateway_events_->subscribe([this](const gateway::GatewayEvent &event) {
      visit_in_place(
          event,
          [&](const gateway::RoutersSet &e) {
            SL_VERBOSE(logger_,
                       "Event RoutersSet: {} routers, session {}",
                       e.router_ids.size(),
                       e.session_id);
          },
          [&](const gateway::InstanceAdded &e) {
            SL_VERBOSE(logger_, "Event InstanceAdded: {}", e.instance);
          },
          [&](const gateway::InstanceRemoved &e) {
            SL_VERBOSE(logger_, "Event InstanceRemoved: {}", e.instance);
          },
          [&](const gateway::MessageRecoveryExecuted &e) {
            SL_VERBOSE(logger_,
                       "Event MessageRecoveryExecuted: {} via {}",
                       e.proof,
                       e.router_id);
          });
    });
    queue_events_->subscribe([this](const gateway::QueueEvent &event) {
      if (auto failure =
              std::get_if<gateway::MessageExecutionFailure>(&event)) {
        SL_WARN(logger_,
                "Queued message #{} failed: {}",
                failure->nonce,
                failure->error.message());
      }
    });
  }

  ReplayApplication::~ReplayApplication() = default;

  outcome::result<void> ReplayApplication::setup() {
    if (not config_.routers().empty()) {
      OUTCOME_TRY(gateway_->setRouters(kRoot, config_.routers()));
    }
    for (const auto &instance : config_.instances()) {
      OUTCOME_TRY(gateway_->addInstance(kRoot, instance));
    }
    return outcome::success();
  }

  outcome::result<void> ReplayApplication::execute(
      const ReplayCommand &command) {
    auto res = visit_in_place(
        command,
        [&](const replay::SetRouters &cmd) {
          return gateway_->setRouters(kRoot, cmd.router_ids);
        },
        [&](const replay::AddInstance &cmd) {
          return gateway_->addInstance(kRoot, cmd.instance);
        },
        [&](const replay::RemoveInstance &cmd) {
          return gateway_->removeInstance(kRoot, cmd.instance);
        },
        [&](const replay::Receive &cmd) {
          return gateway_->receiveMessage(cmd.origin, cmd.router_id, cmd.bytes);
        },
        [&](const replay::Recover &cmd) {
          return gateway_->executeMessageRecovery(
              kRoot, cmd.origin, cmd.proof, cmd.router_id);
        },
        [&](const replay::StartBatch &cmd) {
          return gateway_->startBatchMessage(
              primitives::SignedOrigin{cmd.sender}, cmd.destination);
        },
        [&](const replay::Send &cmd) {
          return gateway_->handle(cmd.sender, cmd.destination, cmd.message);
        },
        [&](const replay::EndBatch &cmd) {
          return gateway_->endBatchMessage(
              primitives::SignedOrigin{cmd.sender}, cmd.destination);
        },
        [&](const replay::Service &cmd) -> outcome::result<void> {
          auto used = queue_->serviceMessageQueue(cmd.max_weight.value_or(
              std::numeric_limits<gateway::Weight>::max()));
          SL_DEBUG(logger_, "Queue serviced, weight used {}", used);
          return outcome::success();
        },
        [&](const replay::Retry &cmd) {
          return queue_->processFailedMessage(cmd.nonce);
        });
    OUTCOME_TRY(res);

    // commands other than an explicit service let the queue drain
    if (not is_type<replay::Service>(command)) {
      queue_->serviceMessageQueue(std::numeric_limits<gateway::Weight>::max());
    }
    return outcome::success();
  }

  int ReplayApplication::run(std::istream &input) {
    if (auto res = setup(); res.has_error()) {
      SL_ERROR(logger_, "Gateway setup failed: {}", res.error().message());
      return EXIT_FAILURE;
    }

    size_t line_number = 0;
    size_t failed = 0;
    std::string line;
    while (std::getline(input, line)) {
      ++line_number;
      auto command = parseReplayCommand(line);
      if (command.has_error()) {
        SL_ERROR(logger_,
                 "Line {}: {}: '{}'",
                 line_number,
                 command.error().message(),
                 line);
        return EXIT_FAILURE;
      }
      if (not command.value().has_value()) {
        continue;
      }
      if (auto res = execute(command.value().value()); res.has_error()) {
        ++failed;
        SL_WARN(logger_, "Line {}: {}", line_number, res.error().message());
      }
    }

    SL_INFO(logger_,
            "Replayed {} lines: {} commands failed, {} messages executed, "
            "{} messages sent, {} failed messages kept",
            line_number,
            failed,
            handler_->handled(),
            sender_->sent(),
            queue_->failedMessages().size());
    return EXIT_SUCCESS;
  }

}  // namespace lpgate::application
