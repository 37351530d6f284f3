#include "app/InstanceCoordinator.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <utility>

namespace pipeweaver::app {

InstanceCoordinator::InstanceCoordinator(infra::RendezvousAddress address,
                                         const infra::AppConfig& config,
                                         infra::MessageRelay& relay)
    : address_(std::move(address)), config_(config), relay_(relay) {}

InstanceCoordinator::~InstanceCoordinator() {
    shutdown();
}

std::string InstanceCoordinator::outcomeToString(LaunchOutcome outcome) {
    switch (outcome) {
    case LaunchOutcome::Primary:
        return "Primary";
    case LaunchOutcome::Forwarded:
        return "Forwarded";
    case LaunchOutcome::LivenessFailed:
        return "LivenessFailed";
    }
    return "Unknown";
}

LaunchOutcome InstanceCoordinator::launch() {
    SingleInstance detector(address_);
    if (detector.detectAndForward()) {
        spdlog::info("Instance Already active, Exiting");
        return LaunchOutcome::Forwarded;
    }

    liveness_ = std::make_unique<infra::LivenessClient>(config_.livenessUrl, relay_);
    auto pending = liveness_->start();
    auto result = infra::LivenessClient::awaitResult(pending);
    if (!result.success) {
        spdlog::error("Failed to Connect to Pipeweaver: {}", result.error);
        failureReason_ = result.error;
        liveness_->stop();
        liveness_.reset();
        return LaunchOutcome::LivenessFailed;
    }

    auto bindStatus = startListener();
    if (bindStatus == infra::ControlListener::BindStatus::Bound) {
        return LaunchOutcome::Primary;
    }

    if (bindStatus == infra::ControlListener::BindStatus::AddressInUse &&
        detector.detectAndForward()) {
        spdlog::info("Lost startup race to another instance, forwarded trigger instead");
        liveness_->stop();
        liveness_.reset();
        return LaunchOutcome::Forwarded;
    }

    spdlog::warn("Running without local control channel");
    return LaunchOutcome::Primary;
}

infra::ControlListener::BindStatus InstanceCoordinator::startListener() {
    listener_ = std::make_unique<infra::ControlListener>(
        address_, relay_, std::chrono::milliseconds(config_.ipcIdleBackoffMs));

    auto status = listener_->start().get();
    spdlog::debug("IPC listener bind status: {}",
                  infra::ControlListener::bindStatusToString(status));

    if (status == infra::ControlListener::BindStatus::Bound) {
        localControl_ = true;
        return status;
    }

    listener_->stop();
    listener_.reset();
    localControl_ = false;
    return status;
}

void InstanceCoordinator::shutdown() {
    if (listener_) {
        listener_->stop();
        listener_.reset();
    }
    localControl_ = false;

    if (liveness_) {
        liveness_->stop();
        liveness_.reset();
    }
}

} // namespace pipeweaver::app
