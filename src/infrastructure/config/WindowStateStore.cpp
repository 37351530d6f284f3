#include "infrastructure/config/WindowStateStore.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>
#include <utility>

namespace pipeweaver::infra {

WindowStateStore::WindowStateStore(std::filesystem::path path) : path_(std::move(path)) {}

core::WindowGeometry WindowStateStore::load() const {
    core::WindowGeometry geometry;

    std::ifstream file(path_);
    if (file) {
        try {
            nlohmann::json j;
            file >> j;
            core::WindowGeometry loaded;
            loaded.width = j.at("width").get<int>();
            loaded.height = j.at("height").get<int>();
            loaded.x = j.at("x").get<int>();
            loaded.y = j.at("y").get<int>();

            spdlog::debug("Loaded geometry: {}x{} at ({}, {})", loaded.width, loaded.height,
                          loaded.x, loaded.y);
            return loaded;
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Ignoring invalid window state {}: {}", path_.string(), e.what());
        }
    }

    spdlog::debug("Using default geometry: {}x{} at ({}, {})", geometry.width, geometry.height,
                  geometry.x, geometry.y);
    return geometry;
}

bool WindowStateStore::save(const core::WindowGeometry& geometry) const {
    spdlog::debug("Saving geometry: {}x{} at ({}, {})", geometry.width, geometry.height,
                  geometry.x, geometry.y);

    std::error_code ec;
    if (!path_.parent_path().empty()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
    if (ec) {
        spdlog::warn("Failed to create window state directory: {}", ec.message());
        return false;
    }

    nlohmann::json j;
    j["width"] = geometry.width;
    j["height"] = geometry.height;
    j["x"] = geometry.x;
    j["y"] = geometry.y;

    std::ofstream file(path_);
    if (!file) {
        spdlog::error("Failed to open window state for writing: {}", path_.string());
        return false;
    }

    file << j.dump(2);
    return static_cast<bool>(file);
}

} // namespace pipeweaver::infra
