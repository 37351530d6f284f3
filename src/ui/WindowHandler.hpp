#pragma once

#include "infrastructure/ipc/MessageRelay.hpp"

#include <QObject>

namespace pipeweaver::ui {

/**
 * @brief UI-side end of the MessageRelay.
 *
 * checkNotifications() is driven by a QTimer on the UI thread and turns each
 * pending window message into a signal. Background threads only ever touch the
 * relay, never this object.
 */
class WindowHandler : public QObject {
    Q_OBJECT

public:
    explicit WindowHandler(infra::MessageRelay& relay, QObject* parent = nullptr);
    ~WindowHandler() override = default;

public slots:
    /**
     * @brief Drains the relay and emits one signal per message.
     */
    void checkNotifications();

signals:
    /**
     * @brief Emitted for every Trigger message; the window should come to the front.
     */
    void triggerRequested();

    /**
     * @brief Emitted for every Close message; the window should shut down.
     */
    void closeRequested();

private:
    infra::MessageRelay& relay_;
};

} // namespace pipeweaver::ui
