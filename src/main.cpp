#include "app/Application.hpp"
#include "app/ErrorDialog.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>

int main(int argc, char* argv[]) {
    try {
        pipeweaver::app::Application app(argc, argv);
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        pipeweaver::app::ErrorDialog::show(std::string("A fatal error occurred:\n") + e.what());
        return 1;
    }
}
