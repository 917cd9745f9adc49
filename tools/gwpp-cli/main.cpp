// ─────────────────────────────────────────────────────────────────────────────
// gwpp-cli - Gateway Session Testing Tool
// ─────────────────────────────────────────────────────────────────────────────
// Connects to a gateway, performs the handshake, and optionally calls one
// method or streams pushed events.
//
// Usage:
//   # Handshake only, print the hello payload
//   gwpp-cli --url ws://localhost:18789/ws --token secret
//
//   # Call a method
//   gwpp-cli --call chat.send --params '{"sessionKey":"main","message":"hi"}'
//
//   # Stream events for 30 seconds (or until Ctrl-C)
//   gwpp-cli --listen --duration 30 --json
//
// Connection settings fall back to GATEWAY_URL, GATEWAY_TOKEN and
// GATEWAY_PASSWORD.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "gwpp/client/gateway_session.hpp"
#include "gwpp/log/spdlog_logger.hpp"

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>

using namespace gwpp;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j, bool compact = false) {
    if (compact) {
        std::cout << j.dump() << "\n";
    } else {
        std::cout << j.dump(2) << "\n";
    }
}

void print_event(const GatewayEvent& event, bool json_output) {
    if (json_output) {
        Json line = {{"event", event.event}, {"payload", event.payload}};
        if (event.seq) {
            line["seq"] = *event.seq;
        }
        print_json(line, true);
        return;
    }
    std::cout << color::c(color::bold) << color::c(color::yellow) << "• " << event.event
              << color::c(color::reset);
    if (event.seq) {
        std::cout << color::c(color::dim) << " #" << *event.seq << color::c(color::reset);
    }
    std::cout << "\n";
    if (!event.payload.is_null()) {
        print_json(event.payload);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Run Options
// ═══════════════════════════════════════════════════════════════════════════

struct RunOptions {
    std::optional<std::string> call_method;
    Json call_params = Json::object();
    bool listen = false;
    std::chrono::seconds duration{0};        // 0 = until interrupted
    std::chrono::seconds connect_timeout{15};
    bool json_output = false;
};

// ═══════════════════════════════════════════════════════════════════════════
// Session Runner
// ═══════════════════════════════════════════════════════════════════════════

int run(GatewaySessionConfig config, const RunOptions& options) {
    asio::io_context io;
    GatewaySession session(io.get_executor(), std::move(config));

    int exit_code = 0;
    bool finished = false;

    asio::steady_timer deadline(io);
    asio::signal_set signals(io, SIGINT, SIGTERM);

    auto finish = [&](int code) {
        if (finished) {
            return;
        }
        finished = true;
        exit_code = code;
        deadline.cancel();
        signals.cancel();
        session.disconnect();
        asio::post(io, [&io]() { io.stop(); });
    };

    signals.async_wait([&](const asio::error_code& ec, int) {
        if (!ec) {
            finish(0);
        }
    });

    deadline.expires_after(options.connect_timeout);
    deadline.async_wait([&](const asio::error_code& ec) {
        if (!ec) {
            print_error("Timed out waiting for the gateway handshake");
            finish(1);
        }
    });

    session.on_error([&](const GatewayError& error) {
        print_error(error.describe());
    });

    session.on_close([&](const std::string& reason) {
        if (!finished) {
            print_error("Connection closed: " + reason);
            finish(1);
        }
    });

    session.on_event([&](const GatewayEvent& event) {
        if (options.listen) {
            print_event(event, options.json_output);
        }
    });

    session.on_hello([&](const Json& hello) {
        deadline.cancel();

        if (options.json_output) {
            if (!options.call_method && !options.listen) {
                print_json(hello);
            }
        } else {
            print_success("Connected");
            print_header("Hello");
            print_json(hello);
        }

        auto after_call = [&]() {
            if (!options.listen) {
                finish(exit_code);
                return;
            }
            if (!options.json_output) {
                print_header("Events");
            }
            if (options.duration.count() > 0) {
                deadline.expires_after(options.duration);
                deadline.async_wait([&](const asio::error_code& ec) {
                    if (!ec) {
                        finish(0);
                    }
                });
            }
        };

        if (!options.call_method) {
            after_call();
            return;
        }

        session.send(*options.call_method, options.call_params,
            [&, after_call](GatewayResult<Json> result) {
                if (!result) {
                    print_error(result.error().describe());
                    finish(1);
                    return;
                }
                if (!options.json_output) {
                    print_header(*options.call_method);
                }
                print_json(*result, options.json_output && options.listen);
                after_call();
            });
    });

    session.connect();
    io.run();
    return exit_code;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("gwpp-cli", "Gateway Session Testing Tool");

    options.add_options()
        // Connection
        ("u,url", "Gateway URL (or GATEWAY_URL)", cxxopts::value<std::string>())
        ("t,token", "Gateway token (or GATEWAY_TOKEN)", cxxopts::value<std::string>())
        ("p,password", "Gateway password (or GATEWAY_PASSWORD)", cxxopts::value<std::string>())
        ("H,header", "Upgrade request header (can be repeated, format: 'Name: Value')",
            cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("settle-ms", "Delay before the handshake when no challenge arrives",
            cxxopts::value<int>()->default_value("750"))
        ("timeout", "Seconds to wait for the handshake", cxxopts::value<int>()->default_value("15"))
        ("insecure", "Skip TLS certificate verification (wss://)")

        // Commands
        ("c,call", "Call a method after the handshake", cxxopts::value<std::string>())
        ("params", "JSON params for --call", cxxopts::value<std::string>()->default_value("{}"))
        ("l,listen", "Print pushed events")
        ("duration", "Seconds to listen (0 = until Ctrl-C)", cxxopts::value<int>()->default_value("0"))

        // Output
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-level", "trace, debug, info, warn, error, fatal or off",
            cxxopts::value<std::string>()->default_value("warn"))
        ("v,verbose", "Shorthand for --log-level debug")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    gwpp-cli --url ws://localhost:18789/ws --token secret\n";
            std::cout << "    gwpp-cli --call chat.send --params '{\"sessionKey\":\"main\",\"message\":\"hi\"}'\n";
            std::cout << "    gwpp-cli --listen --duration 30 --json\n";
            return 0;
        }

        color::enabled = !result.count("no-color");

        // Logging goes to stderr so stdout stays parseable
        auto level_name = result.count("verbose") ? std::string("debug")
                                                  : result["log-level"].as<std::string>();
        auto level = log_level_from_string(level_name);
        if (!level) {
            print_error("Unknown log level '" + level_name + "'");
            return 1;
        }
        set_logger(make_spdlog_stderr_logger(*level));

        auto config = GatewaySessionConfig::from_env();
        if (result.count("url")) {
            config.with_url(result["url"].as<std::string>());
        }
        if (result.count("token")) {
            config.with_token(result["token"].as<std::string>());
        }
        if (result.count("password")) {
            config.with_password(result["password"].as<std::string>());
        }
        config.with_settle_delay(std::chrono::milliseconds(result["settle-ms"].as<int>()));

        for (const auto& header : result["header"].as<std::vector<std::string>>()) {
            if (header.empty()) {
                continue;
            }
            auto colon = header.find(':');
            if (colon == std::string::npos) {
                print_error("Malformed header '" + header + "', expected 'Name: Value'");
                return 1;
            }
            std::string value = header.substr(colon + 1);
            auto start = value.find_first_not_of(" \t");
            config.transport.with_header(header.substr(0, colon),
                                         start == std::string::npos ? "" : value.substr(start));
        }
        if (result.count("insecure")) {
            config.transport.with_verify_peer(false);
        }

        RunOptions run_options;
        run_options.listen = result.count("listen") > 0;
        run_options.json_output = result.count("json") > 0;
        run_options.duration = std::chrono::seconds(result["duration"].as<int>());
        run_options.connect_timeout = std::chrono::seconds(result["timeout"].as<int>());

        if (result.count("call")) {
            run_options.call_method = result["call"].as<std::string>();
            try {
                run_options.call_params = Json::parse(result["params"].as<std::string>());
            } catch (const Json::parse_error& e) {
                print_error(std::string("Invalid --params JSON: ") + e.what());
                return 1;
            }
        }

        if (!run_options.json_output) {
            std::cout << color::c(color::dim) << "Connecting to " << config.url
                      << color::c(color::reset) << "\n";
        }

        return run(std::move(config), run_options);

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
