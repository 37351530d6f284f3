#include "app/SingleInstance.hpp"

#include "core/types/ControlRequest.hpp"
#include "infrastructure/ipc/ControlClient.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace pipeweaver::app {

SingleInstance::SingleInstance(infra::RendezvousAddress address) : address_(std::move(address)) {}

bool SingleInstance::detectAndForward() {
    spdlog::debug("Looking for Socket at {}", address_.path().string());

    if (!address_.exists()) {
        spdlog::debug("Existing socket is not present");
        isRunning_ = false;
        return false;
    }

    spdlog::debug("Attempting to Connect to Existing Socket");
    infra::ControlClient client(address_);
    auto status = client.send(core::ControlRequest::triggerFocus());

    switch (status) {
    case infra::ControlClient::SendStatus::Delivered:
        spdlog::info("Connected to existing instance at {}, sent trigger",
                     address_.path().string());
        isRunning_ = true;
        return true;
    case infra::ControlClient::SendStatus::WriteFailed:
        // The peer accepted the connection, so it is alive even if the write was lost.
        spdlog::warn("Existing instance accepted the connection but the trigger was not sent");
        isRunning_ = true;
        return true;
    case infra::ControlClient::SendStatus::ConnectFailed:
        break;
    }

    spdlog::debug("Removing Stale Socket File");
    address_.remove();
    isRunning_ = false;
    return false;
}

} // namespace pipeweaver::app
