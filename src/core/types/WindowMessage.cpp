#include "core/types/WindowMessage.hpp"

namespace pipeweaver::core {

std::string windowMessageToString(WindowMessage message) {
    switch (message) {
    case WindowMessage::Trigger:
        return "Trigger";
    case WindowMessage::Close:
        return "Close";
    }
    return "Unknown";
}

} // namespace pipeweaver::core
