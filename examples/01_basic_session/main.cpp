// Example 01: Basic Gateway Session
//
// Connects to a gateway, waits for the hello, then sends one chat message
// from a C++20 coroutine.

#include <gwpp/client/gateway_session.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using namespace gwpp;
using Json = nlohmann::json;

asio::awaitable<void> chat(GatewaySession& session, asio::io_context& io, std::string message) {
    std::cout << "Sending: " << message << "\n";

    auto result = co_await session.async_send("chat.send", {
        {"sessionKey", "main"},
        {"message", message},
        {"idempotencyKey", "example-01"}
    });

    if (result) {
        std::cout << "Reply: " << result->dump(2) << "\n";
    } else {
        std::cerr << "ERROR: " << result.error().describe() << "\n";
    }

    session.disconnect();
    io.stop();
}

int main(int argc, char* argv[]) {
    std::string message = argc > 1 ? argv[1] : "Hello from gwpp";

    std::cout << "=== Basic Gateway Session Example ===\n\n";

    // 1. Configure (GATEWAY_URL / GATEWAY_TOKEN / GATEWAY_PASSWORD)
    auto config = GatewaySessionConfig::from_env();
    std::cout << "Gateway: " << config.url << "\n\n";

    asio::io_context io;

    // 2. Create the session
    GatewaySession session(io.get_executor(), config);

    // 3. Register callbacks BEFORE connecting
    session.on_hello([&](const Json& hello) {
        std::cout << "Connected. Hello payload:\n" << hello.dump(2) << "\n\n";
        asio::co_spawn(io, chat(session, io, message), asio::detached);
    });

    session.on_close([&](const std::string& reason) {
        std::cerr << "Connection closed: " << reason << "\n";
        io.stop();
    });

    session.on_error([](const GatewayError& error) {
        std::cerr << "Transport error: " << error.message << "\n";
    });

    // 4. Connect and run
    session.connect();
    io.run();

    std::cout << "\n=== Done ===\n";
    return 0;
}
