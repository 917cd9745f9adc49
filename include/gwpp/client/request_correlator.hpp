#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Request Correlator
// ═══════════════════════════════════════════════════════════════════════════
// Pending-request table keyed by request id. Each entry owns the completion
// for one outstanding request; the completion runs exactly once, either when
// the matching response arrives or when the table is purged on close.
//
// Not thread-safe. GatewaySession only touches it from its strand.

#include "gwpp/client/client_error.hpp"
#include "gwpp/protocol/frame.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

namespace gwpp {

using Json = nlohmann::json;
using RequestId = std::string;

/// Receives the response payload (null when the gateway sent none) or the
/// reason the request failed.
using ResponseHandler = std::function<void(GatewayResult<Json>)>;

struct PendingRequest {
    RequestId id;
    std::string method;
    ResponseHandler completion;
    std::chrono::steady_clock::time_point created_at;
};

class RequestCorrelator {
public:
    RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /// Fresh random (version 4) UUID, lower-case hex
    [[nodiscard]] RequestId next_id();

    /// Register a completion. An id that is already pending is replaced and
    /// the old completion is rejected.
    void track(RequestId id, std::string method, ResponseHandler completion);

    /// Complete with the payload. Returns false for unknown ids.
    bool resolve(const RequestId& id, Json payload);

    /// Complete with an error. Returns false for unknown ids.
    bool reject(const RequestId& id, GatewayError error);

    /// Resolve or reject according to a "res" frame. A failed response
    /// without an error message becomes "request failed".
    bool settle(const ResponseFrame& response);

    /// Reject every pending request with the same error and empty the table.
    /// Returns the number of requests rejected.
    std::size_t reject_all(const GatewayError& error);

    [[nodiscard]] bool contains(const RequestId& id) const;
    [[nodiscard]] std::size_t pending_count() const noexcept { return pending_.size(); }
    [[nodiscard]] bool empty() const noexcept { return pending_.empty(); }

private:
    std::optional<PendingRequest> take(const RequestId& id);
    static void complete(PendingRequest& request, GatewayResult<Json> result);

    std::unordered_map<RequestId, PendingRequest> pending_;
    std::mt19937_64 rng_;
};

}  // namespace gwpp
