#pragma once

#include "core/types/WindowGeometry.hpp"

#include <filesystem>

namespace pipeweaver::infra {

/**
 * @brief Persists the main window geometry as {width, height, x, y} JSON.
 */
class WindowStateStore {
public:
    explicit WindowStateStore(std::filesystem::path path);

    /**
     * @brief Loads the stored geometry.
     * @return Stored geometry, or the defaults if the file is missing or invalid.
     */
    core::WindowGeometry load() const;

    /**
     * @brief Writes the geometry, creating the parent directory if needed.
     * @return True if written successfully.
     */
    bool save(const core::WindowGeometry& geometry) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace pipeweaver::infra
