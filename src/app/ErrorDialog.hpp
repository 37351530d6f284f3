#pragma once

#include <string>

namespace pipeweaver::app {

/**
 * @brief Shows fatal start-up errors before any Qt application exists.
 *
 * Uses kdialog and falls back to zenity when kdialog cannot be started.
 */
class ErrorDialog {
public:
    static constexpr const char* TITLE = "Pipeweaver UI";

    /**
     * @brief Displays an error and blocks until it is dismissed.
     * @param message Text shown to the user.
     * @return True if one of the dialog tools could be started.
     */
    static bool show(const std::string& message);
};

} // namespace pipeweaver::app
