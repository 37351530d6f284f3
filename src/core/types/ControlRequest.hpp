/**
 * @file ControlRequest.hpp
 * @brief Requests sent by a new process invocation to the running instance.
 *
 * The wire format is the raw request literal with no framing, length prefix
 * or terminator. The sender closes the connection after writing.
 */

#pragma once

#include "core/types/WindowMessage.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace pipeweaver::core {

/**
 * @brief Kinds of control request understood by the listener.
 */
enum class ControlRequestKind : int {
    TriggerFocus = 0 ///< Ask the running instance to raise its window
};

/**
 * @brief Immutable fire-and-forget request carried over the rendezvous socket.
 */
class ControlRequest {
public:
    static constexpr std::string_view kTriggerLiteral{"TRIGGER"};

    constexpr explicit ControlRequest(ControlRequestKind kind = ControlRequestKind::TriggerFocus)
        : kind_(kind) {}

    /**
     * @brief Creates the focus request.
     */
    static constexpr ControlRequest triggerFocus() {
        return ControlRequest(ControlRequestKind::TriggerFocus);
    }

    /**
     * @brief Parses a complete message body.
     * @param body Bytes read from the connection until EOF.
     * @return The request if @p body is exactly a known literal, nullopt otherwise.
     */
    static std::optional<ControlRequest> parse(std::string_view body);

    [[nodiscard]] ControlRequestKind kind() const { return kind_; }

    /**
     * @brief Returns the wire encoding of this request.
     */
    [[nodiscard]] std::string encode() const;

    /**
     * @brief Maps the request to the window message it produces.
     */
    [[nodiscard]] WindowMessage toWindowMessage() const;

    bool operator==(const ControlRequest& other) const = default;

private:
    ControlRequestKind kind_;
};

} // namespace pipeweaver::core
