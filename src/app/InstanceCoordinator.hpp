#pragma once

#include "app/SingleInstance.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/ipc/ControlListener.hpp"
#include "infrastructure/ipc/MessageRelay.hpp"
#include "infrastructure/ipc/RendezvousAddress.hpp"
#include "infrastructure/network/LivenessClient.hpp"

#include <memory>
#include <string>

namespace pipeweaver::app {

/**
 * @brief Result of the startup sequence.
 */
enum class LaunchOutcome {
    Primary,       ///< This process owns the session and should show the UI
    Forwarded,     ///< Another instance was asked to raise itself; exit with success
    LivenessFailed ///< The remote service is unreachable; exit with failure
};

/**
 * @brief Runs the startup sequence that precedes UI construction.
 *
 * Order: single-instance detection, remote liveness check, local control
 * listener. A failed liveness check starts no listener. Both background
 * channels feed the same MessageRelay.
 *
 * A second process that loses a concurrent cold start (its listener finds the
 * address owned by a live peer) re-runs detection once and forwards to the
 * winner. Any other listener failure leaves the instance running without
 * local control.
 */
class InstanceCoordinator {
public:
    InstanceCoordinator(infra::RendezvousAddress address, const infra::AppConfig& config,
                        infra::MessageRelay& relay);
    ~InstanceCoordinator();

    InstanceCoordinator(const InstanceCoordinator&) = delete;
    InstanceCoordinator& operator=(const InstanceCoordinator&) = delete;

    /**
     * @brief Runs detection, the liveness check and the listener start-up.
     *
     * Blocks until the liveness result and the listener bind status are known.
     */
    LaunchOutcome launch();

    /**
     * @brief Stops both background channels.
     */
    void shutdown();

    /**
     * @brief Reason reported by the liveness client when launch() failed.
     */
    const std::string& failureReason() const { return failureReason_; }

    /**
     * @brief True if the local control listener is bound.
     */
    bool hasLocalControl() const { return localControl_; }

    const infra::RendezvousAddress& address() const { return address_; }

    static std::string outcomeToString(LaunchOutcome outcome);

private:
    infra::ControlListener::BindStatus startListener();

    infra::RendezvousAddress address_;
    infra::AppConfig config_;
    infra::MessageRelay& relay_;

    std::unique_ptr<infra::LivenessClient> liveness_;
    std::unique_ptr<infra::ControlListener> listener_;
    std::string failureReason_;
    bool localControl_{false};
};

} // namespace pipeweaver::app
