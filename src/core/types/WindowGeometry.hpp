/**
 * @file WindowGeometry.hpp
 * @brief Persisted position and size of the main window.
 */

#pragma once

namespace pipeweaver::core {

/**
 * @brief Window position and size in screen coordinates.
 *
 * Defaults match the minimum size of the main window.
 */
struct WindowGeometry {
    int width{1000};  ///< Window width in pixels
    int height{600};  ///< Window height in pixels
    int x{100};       ///< Window X position
    int y{100};       ///< Window Y position

    bool operator==(const WindowGeometry& other) const = default;
};

} // namespace pipeweaver::core
