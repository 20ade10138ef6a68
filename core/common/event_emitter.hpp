/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include <boost/signals2.hpp>

namespace lpgate::common {

  /**
   * Delivers events of one type to every subscribed handler, in subscription
   * order
   */
  template <typename Event>
  class EventEmitter {
   public:
    using EventHandler = void(const Event &);
    using EventSignal = boost::signals2::signal<EventHandler>;

    boost::signals2::connection subscribe(
        const std::function<EventHandler> &handler) {
      return signal_.connect(handler);
    }

    void fire(const Event &event) const {
      signal_(event);
    }

   private:
    mutable EventSignal signal_;
  };

}  // namespace lpgate::common
