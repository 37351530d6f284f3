#include "ui/resources/AppIcon.hpp"

#include <QLinearGradient>
#include <QPainter>
#include <QPainterPath>

namespace pipeweaver::ui {

namespace {
// Brand colors
const QColor kDeepPurple("#3b1f5c");
const QColor kPurple("#6a3fa0");
const QColor kTeal("#2ec4b6");
const QColor kAmber("#ffb347");
const QColor kWhite(Qt::white);
} // namespace

QIcon AppIcon::applicationIcon() {
    QIcon icon;

    const int sizes[] = {16, 22, 24, 32, 48, 64, 128, 256};
    for (int size : sizes) {
        icon.addPixmap(createPixmap(size, size <= 24));
    }

    return icon;
}

QPixmap AppIcon::createPixmap(int size, bool simplified) {
    QPixmap pixmap(size, size);
    pixmap.fill(Qt::transparent);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.scale(size / 64.0, size / 64.0);

    drawIcon(painter, simplified);

    painter.end();
    return pixmap;
}

void AppIcon::drawIcon(QPainter& painter, bool simplified) {
    QLinearGradient bgGrad(0, 0, 64, 64);
    bgGrad.setColorAt(0, kDeepPurple);
    bgGrad.setColorAt(1, kPurple);

    painter.setPen(Qt::NoPen);
    painter.setBrush(bgGrad);
    painter.drawRoundedRect(4, 4, 56, 56, 12, 12);

    drawStrands(painter, simplified);

    if (!simplified) {
        // Input and output ports
        painter.setPen(Qt::NoPen);
        painter.setBrush(kWhite);
        painter.drawEllipse(QPointF(12, 22), 3, 3);
        painter.drawEllipse(QPointF(12, 42), 3, 3);
        painter.drawEllipse(QPointF(52, 22), 3, 3);
        painter.drawEllipse(QPointF(52, 42), 3, 3);
    }
}

void AppIcon::drawStrands(QPainter& painter, bool simplified) {
    // Two routes crossing in the middle, like audio being woven between ports
    QPainterPath down;
    down.moveTo(12, 22);
    down.cubicTo(32, 22, 32, 42, 52, 42);

    QPainterPath up;
    up.moveTo(12, 42);
    up.cubicTo(32, 42, 32, 22, 52, 22);

    QPen tealPen(kTeal, simplified ? 6.0 : 4.5);
    tealPen.setCapStyle(Qt::RoundCap);
    QPen amberPen(kAmber, simplified ? 6.0 : 4.5);
    amberPen.setCapStyle(Qt::RoundCap);

    painter.setBrush(Qt::NoBrush);
    painter.setPen(tealPen);
    painter.drawPath(down);
    painter.setPen(amberPen);
    painter.drawPath(up);

    if (!simplified) {
        // Straight pass-through route
        QPen whitePen(QColor(255, 255, 255, 160), 2.5);
        whitePen.setCapStyle(Qt::RoundCap);
        painter.setPen(whitePen);
        painter.drawLine(QPointF(12, 32), QPointF(52, 32));
    }
}

} // namespace pipeweaver::ui
