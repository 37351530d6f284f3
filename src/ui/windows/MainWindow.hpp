#pragma once

#include "ui/WindowHandler.hpp"

#include <QMainWindow>
#include <QTimer>

class QWebEngineView;

namespace pipeweaver::ui {

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

public slots:
    void bringToFront();
    void requestShutdown();

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    void setupUi();
    void setupConnections();

    void saveWindowState();
    void restoreWindowState();

    QWebEngineView* webView_{nullptr};
    WindowHandler* windowHandler_{nullptr};
    QTimer* notificationTimer_{nullptr};
    bool stateSaved_{false};
};

} // namespace pipeweaver::ui
