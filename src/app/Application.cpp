#include "app/Application.hpp"

#include "app/EngineEnvironment.hpp"
#include "app/ErrorDialog.hpp"
#include "ui/resources/AppIcon.hpp"
#include "ui/windows/MainWindow.hpp"

#include <QGuiApplication>
#include <QStandardPaths>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace pipeweaver::app {

namespace {

constexpr const char* APP_VERSION = "0.1.0";
constexpr const char* LIVENESS_FAILURE_MESSAGE = "Cannot Start, Pipeweaver is not running.   ";

} // namespace

Application* Application::instance_ = nullptr;

Application::Application(int& argc, char** argv) : argc_(argc), argv_(argv) {
    instance_ = this;

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (coordinator_) {
        coordinator_->shutdown();
    }

    qtApp_.reset();
    instance_ = nullptr;
}

void Application::initializeLogging() {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::info);

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    std::string logFileError;
    std::filesystem::path logPath;

    auto dataDir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    if (!dataDir.isEmpty()) {
        auto logDir = std::filesystem::path(dataDir.toStdString()) / "pipeweaver-app";
        std::error_code ec;
        std::filesystem::create_directories(logDir, ec);
        logPath = logDir / "pipeweaver-app.log";

        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(), 5 * 1024 * 1024, 3);
            fileSink->set_level(spdlog::level::debug);
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& e) {
            logFileError = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("pipeweaver", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("Pipeweaver App {} starting...", APP_VERSION);
    if (logFileError.empty() && !logPath.empty()) {
        spdlog::info("Log file: {}", logPath.string());
    } else if (!logFileError.empty()) {
        spdlog::warn("Log file unavailable: {}", logFileError);
    }
}

void Application::initializeComponents() {
    // Configuration
    config_ = std::make_unique<infra::ConfigManager>(infra::ConfigManager::defaultConfigDir());
    config_->load();

    auto level = spdlog::level::from_str(config_->config().logLevel);
    spdlog::set_level(level);
    if (level < spdlog::level::info) {
        spdlog::default_logger()->sinks().front()->set_level(level);
    }

    windowState_ = std::make_unique<infra::WindowStateStore>(config_->windowStatePath());

    // Channel for notifications from background threads to the window
    relay_ = std::make_unique<infra::MessageRelay>();

    coordinator_ = std::make_unique<InstanceCoordinator>(
        infra::RendezvousAddress::forSession(config_->config().appName), config_->config(),
        *relay_);

    spdlog::info("Application components initialized");
}

void Application::initializeToolkit() {
    EngineEnvironment::fromConfig(config_->config()).apply();

    qtApp_ = std::make_unique<QApplication>(argc_, argv_);
    qtApp_->setApplicationName("Pipeweaver");
    qtApp_->setApplicationVersion(APP_VERSION);
    qtApp_->setOrganizationName("Pipeweaver");

    // Configure Qt to pick the relevant desktop file
    QGuiApplication::setDesktopFileName(QString::fromStdString(config_->config().desktopFileName));
    QGuiApplication::setWindowIcon(ui::AppIcon::applicationIcon());
}

int Application::run() {
    switch (coordinator_->launch()) {
    case LaunchOutcome::Forwarded:
        return 0;
    case LaunchOutcome::LivenessFailed:
        ErrorDialog::show(LIVENESS_FAILURE_MESSAGE);
        return 1;
    case LaunchOutcome::Primary:
        break;
    }

    initializeToolkit();

    ui::MainWindow mainWindow;
    mainWindow.show();

    int rc = qtApp_->exec();
    coordinator_->shutdown();
    return rc;
}

Application& Application::instance() {
    return *instance_;
}

} // namespace pipeweaver::app
