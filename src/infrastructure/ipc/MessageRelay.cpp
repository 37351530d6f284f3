#include "infrastructure/ipc/MessageRelay.hpp"

namespace pipeweaver::infra {

void MessageRelay::send(core::WindowMessage message) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(message);
}

std::optional<core::WindowMessage> MessageRelay::tryReceive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }

    auto message = queue_.front();
    queue_.pop_front();
    return message;
}

std::vector<core::WindowMessage> MessageRelay::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::WindowMessage> messages(queue_.begin(), queue_.end());
    queue_.clear();
    return messages;
}

size_t MessageRelay::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace pipeweaver::infra
