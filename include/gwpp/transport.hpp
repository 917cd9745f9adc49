#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// The session talks to the gateway through ITransport, a callback-driven
// message socket modelled on the browser WebSocket: open() starts connecting,
// and the transport later reports open / message / error / close through the
// handlers it was given. The concrete WebSocket implementation lives in
// "gwpp/transport/websocket_transport.hpp".

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace gwpp {

using Json = nlohmann::json;

struct TransportError {
    enum class Category { Network, Timeout, Protocol, Tls, Closed };

    Category category{};
    std::string message;
    std::optional<int> status_code{};
};

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

/// Mirrors the browser WebSocket readyState values
enum class ReadyState : std::uint8_t {
    Connecting,
    Open,
    Closing,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(ReadyState state) noexcept {
    switch (state) {
        case ReadyState::Connecting: return "connecting";
        case ReadyState::Open:       return "open";
        case ReadyState::Closing:    return "closing";
        case ReadyState::Closed:     return "closed";
    }
    return "unknown";
}

/// WebSocket close codes used by the session
namespace close_code {
inline constexpr std::uint16_t Normal          = 1000;
inline constexpr std::uint16_t GoingAway       = 1001;
inline constexpr std::uint16_t NoStatus        = 1005;  // never sent on the wire
inline constexpr std::uint16_t Abnormal        = 1006;  // never sent on the wire
inline constexpr std::uint16_t HandshakeFailed = 4008;
}  // namespace close_code

struct CloseEvent {
    std::uint16_t code{close_code::Abnormal};
    std::string reason;
    bool was_clean{false};
};

/// Event sinks handed to ITransport::open(). They may be invoked from the
/// transport's own I/O thread; on_close is delivered exactly once per open().
struct TransportHandlers {
    std::function<void()> on_open;
    std::function<void(std::string)> on_message;
    std::function<void(const TransportError&)> on_error;
    std::function<void(const CloseEvent&)> on_close;
};

class ITransport {
public:
    virtual ~ITransport() = default;

    /// Begin connecting. Called at most once per transport instance.
    virtual void open(TransportHandlers handlers) = 0;

    /// Queue one text message. Fails unless ready_state() is Open.
    [[nodiscard]] virtual TransportResult<void> send(std::string text) = 0;

    /// Start the closing handshake (or abort a pending connect). The close
    /// event is still reported through on_close.
    virtual void close(std::uint16_t code = close_code::Normal, std::string reason = {}) = 0;

    [[nodiscard]] virtual ReadyState ready_state() const noexcept = 0;
};

/// Creates a fresh transport for every connection attempt
using TransportFactory = std::function<std::unique_ptr<ITransport>(const std::string& url)>;

}  // namespace gwpp
