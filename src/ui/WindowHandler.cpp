#include "ui/WindowHandler.hpp"

#include <spdlog/spdlog.h>

namespace pipeweaver::ui {

WindowHandler::WindowHandler(infra::MessageRelay& relay, QObject* parent)
    : QObject(parent), relay_(relay) {}

void WindowHandler::checkNotifications() {
    for (auto message : relay_.drain()) {
        spdlog::debug("Window message: {}", core::windowMessageToString(message));

        switch (message) {
        case core::WindowMessage::Trigger:
            emit triggerRequested();
            break;
        case core::WindowMessage::Close:
            emit closeRequested();
            break;
        }
    }
}

} // namespace pipeweaver::ui
