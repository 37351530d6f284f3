#pragma once

#include <QIcon>
#include <QPixmap>

class QPainter;

namespace pipeweaver::ui {

/**
 * @brief Provides application branding icons.
 *
 * Paints the Pipeweaver logo programmatically, so no image resources need to
 * be bundled with the binary.
 */
class AppIcon {
public:
    /**
     * @brief Get the main application icon.
     *
     * Returns a QIcon with the logo rendered at the common window and
     * taskbar sizes.
     *
     * @return QIcon containing the application icon
     */
    static QIcon applicationIcon();

    /**
     * @brief Generate icon pixmap at specific size.
     *
     * @param size Icon size in pixels (width and height)
     * @param simplified Use fewer strands for small sizes
     * @return QPixmap with the icon
     */
    static QPixmap createPixmap(int size, bool simplified = false);

private:
    static void drawIcon(QPainter& painter, bool simplified);
    static void drawStrands(QPainter& painter, bool simplified);
};

} // namespace pipeweaver::ui
