#pragma once

#include "infrastructure/config/ConfigManager.hpp"

#include <string>
#include <vector>

namespace pipeweaver::app {

/**
 * @brief Process environment handed to the web engine at toolkit start-up.
 *
 * Built once from the configuration and applied before QApplication is
 * constructed. Immutable after construction.
 */
class EngineEnvironment {
public:
    EngineEnvironment(std::vector<std::string> chromiumFlags, std::string qpaPlatform);

    static EngineEnvironment fromConfig(const infra::AppConfig& config);

    /**
     * @brief Value for QTWEBENGINE_CHROMIUM_FLAGS (flags joined by spaces).
     */
    std::string chromiumFlagsValue() const;

    const std::vector<std::string>& chromiumFlags() const { return chromiumFlags_; }
    const std::string& qpaPlatform() const { return qpaPlatform_; }

    /**
     * @brief Exports the environment and sets toolkit attributes.
     * @note Must run before the QApplication is created.
     */
    void apply() const;

private:
    const std::vector<std::string> chromiumFlags_;
    const std::string qpaPlatform_;
};

} // namespace pipeweaver::app
