#include "gwpp/client/event_fanout.hpp"
#include "gwpp/log/logger.hpp"

#include <format>
#include <vector>

namespace gwpp {

EventFanout::HandlerId EventFanout::add(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    entries_.emplace(id, Entry{std::nullopt, std::move(handler)});
    return id;
}

EventFanout::HandlerId EventFanout::add(std::string event, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    entries_.emplace(id, Entry{std::move(event), std::move(handler)});
    return id;
}

bool EventFanout::remove(HandlerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(id) > 0;
}

void EventFanout::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::size_t EventFanout::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void EventFanout::dispatch(const GatewayEvent& event) const {
    // Copy under lock so handlers can (un)subscribe without deadlocking
    std::vector<Handler> matching;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        matching.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            if (entry.handler && (!entry.event || *entry.event == event.event)) {
                matching.push_back(entry.handler);
            }
        }
    }

    for (const auto& handler : matching) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            GWPP_LOG_ERROR(std::format("Exception in '{}' event handler: {}", event.event, e.what()));
        }
    }
}

std::function<void(const GatewayEvent&)> EventFanout::handler() {
    return [this](const GatewayEvent& event) { dispatch(event); };
}

}  // namespace gwpp
