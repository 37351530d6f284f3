/**
 * @file WindowMessage.hpp
 * @brief Events delivered from background channels to the UI thread.
 */

#pragma once

#include <string>

namespace pipeweaver::core {

/**
 * @brief Internal event consumed by the UI event sink.
 *
 * Produced by the control listener and the liveness client, consumed exactly
 * once on the UI thread.
 */
enum class WindowMessage : int {
    Trigger = 0, ///< Bring the window to the foreground
    Close = 1    ///< Begin graceful shutdown
};

/**
 * @brief Converts a window message to a printable name.
 * @param message The message to convert.
 * @return "Trigger" or "Close".
 */
std::string windowMessageToString(WindowMessage message);

} // namespace pipeweaver::core
