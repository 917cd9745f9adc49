#include "gwpp/client/client_error.hpp"

namespace gwpp {

GatewayError GatewayError::connection_closed(int code, std::string reason) {
    std::string message = "gateway closed (" + std::to_string(code) + "): ";
    message += reason.empty() ? std::string("no reason") : reason;
    return {GatewayErrorCode::ConnectionClosed, std::move(message), code, std::move(reason)};
}

std::string GatewayError::describe() const {
    std::string out(to_string(code));
    out += ": ";
    out += message;
    return out;
}

}  // namespace gwpp
