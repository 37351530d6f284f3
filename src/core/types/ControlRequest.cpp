#include "core/types/ControlRequest.hpp"

namespace pipeweaver::core {

std::optional<ControlRequest> ControlRequest::parse(std::string_view body) {
    if (body == kTriggerLiteral) {
        return ControlRequest::triggerFocus();
    }
    return std::nullopt;
}

std::string ControlRequest::encode() const {
    switch (kind_) {
    case ControlRequestKind::TriggerFocus:
        return std::string(kTriggerLiteral);
    }
    return {};
}

WindowMessage ControlRequest::toWindowMessage() const {
    switch (kind_) {
    case ControlRequestKind::TriggerFocus:
        return WindowMessage::Trigger;
    }
    return WindowMessage::Trigger;
}

} // namespace pipeweaver::core
