/**
 * @file LivenessResult.hpp
 * @brief Outcome of the startup reachability check of the remote service.
 */

#pragma once

#include <string>
#include <utility>

namespace pipeweaver::core {

/**
 * @brief One-shot result reported by the liveness client.
 *
 * Sent exactly once. The startup sequence blocks on it before any local
 * listener or UI is created.
 */
struct LivenessResult {
    bool success{false};   ///< True if the remote endpoint accepted the connection
    std::string error;     ///< Reason for the failure, empty on success

    static LivenessResult connected() { return {true, {}}; }
    static LivenessResult failed(std::string reason) { return {false, std::move(reason)}; }

    bool operator==(const LivenessResult& other) const = default;
};

} // namespace pipeweaver::core
