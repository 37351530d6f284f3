#include "infrastructure/ipc/RendezvousAddress.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <system_error>
#include <utility>

namespace pipeweaver::infra {

RendezvousAddress::RendezvousAddress(std::filesystem::path socketPath)
    : path_(std::move(socketPath)) {}

RendezvousAddress RendezvousAddress::forSession(const std::string& appName) {
    return RendezvousAddress(runtimeDirectory() / (appName + ".sock"));
}

std::filesystem::path RendezvousAddress::runtimeDirectory() {
    const char* runtimeDir = std::getenv("XDG_RUNTIME_DIR");
    if (runtimeDir && *runtimeDir) {
        return std::filesystem::path(runtimeDir);
    }

    std::error_code ec;
    auto tempDir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return std::filesystem::path("/tmp");
    }
    return tempDir;
}

bool RendezvousAddress::exists() const {
    std::error_code ec;
    auto status = std::filesystem::symlink_status(path_, ec);
    return !ec && std::filesystem::exists(status);
}

bool RendezvousAddress::remove() const {
    std::error_code ec;
    bool removed = std::filesystem::remove(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove rendezvous socket {}: {}", path_.string(), ec.message());
        return false;
    }
    return removed;
}

bool RendezvousAddress::ensureParentDirectory() const {
    auto parent = path_.parent_path();
    if (parent.empty()) {
        return true;
    }

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        spdlog::warn("Failed to create socket directory {}: {}", parent.string(), ec.message());
        return false;
    }
    return std::filesystem::is_directory(parent, ec);
}

} // namespace pipeweaver::infra
