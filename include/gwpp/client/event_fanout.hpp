#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Event Fan-out
// ═══════════════════════════════════════════════════════════════════════════
// GatewaySession has a single event slot. EventFanout sits in that slot and
// forwards each event to any number of handlers, optionally filtered by
// event name.
//
//   EventFanout fanout;
//   session.on_event(fanout.handler());
//   auto id = fanout.add("chat", [](const GatewayEvent& ev) { ... });
//   ...
//   fanout.remove(id);
//
// The fan-out must outlive the session it is attached to.

#include "gwpp/client/gateway_session.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace gwpp {

class EventFanout {
public:
    using Handler = std::function<void(const GatewayEvent&)>;
    using HandlerId = std::uint64_t;

    /// Receive every event
    HandlerId add(Handler handler);

    /// Receive only events named `event`
    HandlerId add(std::string event, Handler handler);

    /// Returns false for an unknown or already removed id
    bool remove(HandlerId id);

    void clear();

    [[nodiscard]] std::size_t size() const;

    /// Invoke matching handlers in registration order. Handlers may add or
    /// remove handlers; changes apply from the next event.
    void dispatch(const GatewayEvent& event) const;

    /// Callable suitable for GatewaySession::on_event
    [[nodiscard]] std::function<void(const GatewayEvent&)> handler();

private:
    struct Entry {
        std::optional<std::string> event;
        Handler handler;
    };

    mutable std::mutex mutex_;
    std::map<HandlerId, Entry> entries_;
    HandlerId next_id_{1};
};

}  // namespace gwpp
