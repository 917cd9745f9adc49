#include "gwpp/client/request_correlator.hpp"
#include "gwpp/log/logger.hpp"

#include <format>
#include <utility>

namespace gwpp {

RequestCorrelator::RequestCorrelator()
    : rng_(std::random_device{}())
{}

RequestId RequestCorrelator::next_id() {
    const std::uint64_t hi = rng_();
    const std::uint64_t lo = rng_();

    // xxxxxxxx-xxxx-4xxx-Yxxx-xxxxxxxxxxxx, Y in [8, b]
    return std::format(
        "{:08x}-{:04x}-4{:03x}-{:04x}-{:012x}",
        static_cast<std::uint32_t>(hi >> 32),
        static_cast<std::uint32_t>((hi >> 16) & 0xffff),
        static_cast<std::uint32_t>(hi & 0x0fff),
        static_cast<std::uint32_t>(0x8000 | ((lo >> 48) & 0x3fff)),
        lo & 0xffffffffffffULL
    );
}

void RequestCorrelator::track(RequestId id, std::string method, ResponseHandler completion) {
    if (auto previous = take(id)) {
        GWPP_LOG_WARN("Duplicate request id " + id + ", rejecting earlier request");
        complete(*previous, tl::unexpected(GatewayError::request_failed("duplicate request id")));
    }
    PendingRequest request{
        id,
        std::move(method),
        std::move(completion),
        std::chrono::steady_clock::now()
    };
    pending_.emplace(std::move(id), std::move(request));
}

bool RequestCorrelator::resolve(const RequestId& id, Json payload) {
    auto request = take(id);
    if (!request) {
        return false;
    }
    complete(*request, std::move(payload));
    return true;
}

bool RequestCorrelator::reject(const RequestId& id, GatewayError error) {
    auto request = take(id);
    if (!request) {
        return false;
    }
    complete(*request, tl::unexpected(std::move(error)));
    return true;
}

bool RequestCorrelator::settle(const ResponseFrame& response) {
    if (response.ok) {
        return resolve(response.id, response.payload.value_or(Json{}));
    }
    return reject(
        response.id,
        GatewayError::request_failed(response.error_message.value_or("request failed"))
    );
}

std::size_t RequestCorrelator::reject_all(const GatewayError& error) {
    // Detach first: completions may issue new requests against this table
    auto drained = std::exchange(pending_, {});
    for (auto& [id, request] : drained) {
        complete(request, tl::unexpected(error));
    }
    return drained.size();
}

bool RequestCorrelator::contains(const RequestId& id) const {
    return pending_.find(id) != pending_.end();
}

std::optional<PendingRequest> RequestCorrelator::take(const RequestId& id) {
    auto node = pending_.extract(id);
    if (node.empty()) {
        return std::nullopt;
    }
    return std::move(node.mapped());
}

void RequestCorrelator::complete(PendingRequest& request, GatewayResult<Json> result) {
    if (!request.completion) {
        return;
    }
    try {
        request.completion(std::move(result));
    } catch (const std::exception& e) {
        GWPP_LOG_ERROR(std::format("Exception in completion for '{}': {}", request.method, e.what()));
    }
}

}  // namespace gwpp
