#include "infrastructure/config/ConfigManager.hpp"

#include <QStandardPaths>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>
#include <utility>

namespace pipeweaver::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    std::error_code ec;
    if (!std::filesystem::exists(configDir_, ec)) {
        std::filesystem::create_directories(configDir_, ec);
        if (ec) {
            spdlog::warn("Failed to create config directory {}: {}", configDir_.string(),
                         ec.message());
        }
    }

    configPath_ = configDir_ / "config.json";
}

std::filesystem::path ConfigManager::defaultConfigDir() {
    auto base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (base.isEmpty()) {
        return std::filesystem::path(".") / "pipeweaver";
    }
    return std::filesystem::path(base.toStdString()) / "pipeweaver";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

std::filesystem::path ConfigManager::windowStatePath() const {
    return configDir_ / "window.json";
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    j["liveness"]["url"] = config_.livenessUrl;

    j["ipc"]["app_name"] = config_.appName;
    j["ipc"]["idle_backoff_ms"] = config_.ipcIdleBackoffMs;

    j["ui"]["remote_url"] = config_.remoteUiUrl;
    j["ui"]["poll_interval_ms"] = config_.uiPollIntervalMs;
    j["ui"]["desktop_file_name"] = config_.desktopFileName;

    j["engine"]["chromium_flags"] = config_.chromiumFlags;
    j["engine"]["qpa_platform"] = config_.qpaPlatform;

    j["logging"]["level"] = config_.logLevel;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    // Parsed into a copy so a type error leaves the current settings untouched.
    const AppConfig defaults;
    AppConfig parsed = config_;

    if (j.contains("liveness")) {
        const auto& l = j["liveness"];
        parsed.livenessUrl = l.value("url", defaults.livenessUrl);
    }

    if (j.contains("ipc")) {
        const auto& i = j["ipc"];
        parsed.appName = i.value("app_name", defaults.appName);
        parsed.ipcIdleBackoffMs = i.value("idle_backoff_ms", defaults.ipcIdleBackoffMs);
    }

    if (j.contains("ui")) {
        const auto& u = j["ui"];
        parsed.remoteUiUrl = u.value("remote_url", defaults.remoteUiUrl);
        parsed.uiPollIntervalMs = u.value("poll_interval_ms", defaults.uiPollIntervalMs);
        parsed.desktopFileName = u.value("desktop_file_name", defaults.desktopFileName);
    }

    if (j.contains("engine")) {
        const auto& e = j["engine"];
        parsed.chromiumFlags = e.value("chromium_flags", defaults.chromiumFlags);
        parsed.qpaPlatform = e.value("qpa_platform", defaults.qpaPlatform);
    }

    if (j.contains("logging")) {
        const auto& lg = j["logging"];
        parsed.logLevel = lg.value("level", defaults.logLevel);
    }

    if (parsed.appName.empty()) {
        spdlog::warn("Empty ipc.app_name in config, using {}", defaults.appName);
        parsed.appName = defaults.appName;
    }
    if (parsed.ipcIdleBackoffMs <= 0) {
        parsed.ipcIdleBackoffMs = defaults.ipcIdleBackoffMs;
    }
    if (parsed.uiPollIntervalMs <= 0) {
        parsed.uiPollIntervalMs = defaults.uiPollIntervalMs;
    }

    // from_str maps unknown names to off, which would silence all logging
    if (spdlog::level::from_str(parsed.logLevel) == spdlog::level::off && parsed.logLevel != "off") {
        spdlog::warn("Unknown logging.level '{}', using {}", parsed.logLevel, defaults.logLevel);
        parsed.logLevel = defaults.logLevel;
    }

    config_ = std::move(parsed);
}

} // namespace pipeweaver::infra
