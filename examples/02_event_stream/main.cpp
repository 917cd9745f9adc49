// Example 02: Event Stream with Fan-out
//
// Several independent handlers share the session's single event slot
// through EventFanout. Runs until Ctrl-C.

#include <gwpp/client/event_fanout.hpp>
#include <gwpp/client/gateway_session.hpp>
#include <gwpp/log/spdlog_logger.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>

using namespace gwpp;
using Json = nlohmann::json;

int main() {
    std::cout << "=== Event Stream Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // Declared before the session so it outlives it
    EventFanout fanout;

    asio::io_context io;
    GatewaySession session(io.get_executor(), GatewaySessionConfig::from_env());

    // 1. Route all events through the fan-out
    session.on_event(fanout.handler());

    // 2. Chat transcript
    fanout.add("chat", [](const GatewayEvent& event) {
        const auto& payload = event.payload;
        if (!payload.is_object()) {
            std::cout << "[chat] " << payload.dump() << "\n";
            return;
        }
        std::cout << "[chat] "
                  << payload.value("role", std::string("?")) << ": "
                  << payload.value("text", payload.dump()) << "\n";
    });

    // 3. Per-event counters, across all event names
    std::map<std::string, int> counts;
    fanout.add([&counts](const GatewayEvent& event) {
        ++counts[event.event];
    });

    // 4. Gap detection on sequence numbers
    std::optional<std::int64_t> last_seq;
    fanout.add([&last_seq](const GatewayEvent& event) {
        if (!event.seq) {
            return;
        }
        if (last_seq && *event.seq != *last_seq + 1) {
            std::cout << "[seq] gap: " << *last_seq << " -> " << *event.seq << "\n";
        }
        last_seq = event.seq;
    });

    session.on_hello([](const Json&) {
        std::cout << "Connected; listening for events (Ctrl-C to stop)\n\n";
    });
    session.on_close([&io](const std::string& reason) {
        std::cout << "Closed: " << reason << "\n";
        io.stop();
    });

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const asio::error_code&, int) {
        session.disconnect();
        io.stop();
    });

    session.connect();
    io.run();

    std::cout << "\n=== Event Counts ===\n";
    for (const auto& [name, count] : counts) {
        std::cout << "  " << name << ": " << count << "\n";
    }
    return 0;
}
