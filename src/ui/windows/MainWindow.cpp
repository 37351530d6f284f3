#include "ui/windows/MainWindow.hpp"

#include "app/Application.hpp"

#include <QApplication>
#include <QCloseEvent>
#include <QUrl>
#include <QWebEngineView>
#include <spdlog/spdlog.h>

namespace pipeweaver::ui {

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
    setWindowTitle("Pipeweaver");
    setMinimumSize(1000, 600);

    setupUi();
    setupConnections();
    restoreWindowState();

    // The relay is polled from the UI thread; background threads never call into Qt.
    auto& config = app::Application::instance().config().config();
    notificationTimer_->start(config.uiPollIntervalMs);
}

MainWindow::~MainWindow() {
    saveWindowState();
}

void MainWindow::setupUi() {
    auto& config = app::Application::instance().config().config();

    webView_ = new QWebEngineView(this);
    webView_->setUrl(QUrl(QString::fromStdString(config.remoteUiUrl)));
    setCentralWidget(webView_);

    windowHandler_ = new WindowHandler(app::Application::instance().relay(), this);
    notificationTimer_ = new QTimer(this);
}

void MainWindow::setupConnections() {
    connect(notificationTimer_, &QTimer::timeout, windowHandler_,
            &WindowHandler::checkNotifications);
    connect(windowHandler_, &WindowHandler::triggerRequested, this, &MainWindow::bringToFront);
    connect(windowHandler_, &WindowHandler::closeRequested, this, &MainWindow::requestShutdown);
}

void MainWindow::bringToFront() {
    spdlog::debug("Bringing window to front");
    if (isMinimized()) {
        setWindowState((windowState() & ~Qt::WindowMinimized) | Qt::WindowActive);
    }
    show();
    raise();
    activateWindow();
}

void MainWindow::requestShutdown() {
    spdlog::info("Close requested, shutting down");
    notificationTimer_->stop();
    close();
    QApplication::quit();
}

void MainWindow::closeEvent(QCloseEvent* event) {
    saveWindowState();
    event->accept();
}

void MainWindow::saveWindowState() {
    if (stateSaved_) {
        return;
    }

    auto geom = isMaximized() || isMinimized() ? normalGeometry() : geometry();
    core::WindowGeometry geometry;
    geometry.width = geom.width();
    geometry.height = geom.height();
    geometry.x = geom.x();
    geometry.y = geom.y();

    stateSaved_ = app::Application::instance().windowState().save(geometry);
}

void MainWindow::restoreWindowState() {
    auto geometry = app::Application::instance().windowState().load();
    resize(geometry.width, geometry.height);
    move(geometry.x, geometry.y);
}

} // namespace pipeweaver::ui
