#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace pipeweaver::infra {

/**
 * @brief Application configuration settings.
 *
 * Everything here is read once at startup; nothing is reloaded while the
 * application runs.
 */
struct AppConfig {
    // Remote service
    std::string livenessUrl{"ws://localhost:14565/api/websocket"}; ///< WebSocket watched for liveness.

    // Local control channel
    std::string appName{"pipeweaver-app"}; ///< Stem of the rendezvous socket name.
    int ipcIdleBackoffMs{100};             ///< Listener sleep between accept attempts.

    // UI
    std::string remoteUiUrl{"http://localhost:14565/"}; ///< Page shown in the web view.
    int uiPollIntervalMs{100};                          ///< Notification poll interval.
    std::string desktopFileName{"pipeweaver-app"};      ///< Desktop entry used by the shell.

    // Web engine
    std::vector<std::string> chromiumFlags{
        "--enable-features=Canvas2DImageChromium",
        "--enable-gpu-memory-buffer-compositor-resources",
        "--enable-zero-copy",
        "--force-gpu-mem-available-mb=256",
        "--max-decoded-image-size-mb=64",
        "--js-flags=--expose-gc,--max-old-space-size=128",
        "--disable-software-rasterizer",
        "--disable-dev-shm-usage",
        "--disable-gpu-shader-disk-cache",
        "--num-raster-threads=2",
        "--single-process"}; ///< Flags passed to the Chromium engine.
    std::string qpaPlatform; ///< Qt platform plugin override, empty for default.

    // Logging
    std::string logLevel{"debug"}; ///< spdlog level name.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Loads and saves the application configuration as JSON. Missing keys keep
 * their defaults, so older files continue to load.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Default configuration directory (<user config dir>/pipeweaver).
     */
    static std::filesystem::path defaultConfigDir();

    /**
     * @brief Loads configuration from disk, writing defaults if no file exists.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path of the persisted window geometry.
     */
    std::filesystem::path windowStatePath() const;

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace pipeweaver::infra
