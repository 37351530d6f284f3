#pragma once

#include "app/InstanceCoordinator.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/config/WindowStateStore.hpp"
#include "infrastructure/ipc/MessageRelay.hpp"

#include <QApplication>
#include <memory>

namespace pipeweaver::app {

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    /**
     * @brief Runs the startup sequence and, for the primary instance, the UI.
     * @return Process exit code.
     */
    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::MessageRelay& relay() { return *relay_; }
    infra::WindowStateStore& windowState() { return *windowState_; }

    static Application& instance();

private:
    void initializeLogging();
    void initializeComponents();
    void initializeToolkit();

    int& argc_;
    char** argv_;

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::MessageRelay> relay_;
    std::unique_ptr<infra::WindowStateStore> windowState_;
    std::unique_ptr<InstanceCoordinator> coordinator_;
    std::unique_ptr<QApplication> qtApp_;

    static Application* instance_;
};

} // namespace pipeweaver::app
