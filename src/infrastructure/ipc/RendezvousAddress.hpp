#pragma once

#include <filesystem>
#include <string>

namespace pipeweaver::infra {

/**
 * @brief Session-scoped filesystem address of the local control socket.
 *
 * Derived from the application name and the user's runtime directory
 * ($XDG_RUNTIME_DIR, or the system temporary directory when unset). Exactly
 * one address exists per (user, application) pair. The value is computed on
 * demand and never cached across restarts.
 */
class RendezvousAddress {
public:
    /**
     * @brief Wraps an explicit socket path.
     * @param socketPath Full path of the Unix-domain socket file.
     */
    explicit RendezvousAddress(std::filesystem::path socketPath);

    /**
     * @brief Computes the address for the current user session.
     * @param appName Application identity, used as the socket file stem.
     * @return Address at <runtime dir>/<appName>.sock.
     */
    static RendezvousAddress forSession(const std::string& appName);

    /**
     * @brief Returns the runtime directory used for session addresses.
     */
    static std::filesystem::path runtimeDirectory();

    const std::filesystem::path& path() const { return path_; }

    /**
     * @brief Checks whether the backing filesystem entity exists.
     */
    bool exists() const;

    /**
     * @brief Removes the backing filesystem entity if present.
     * @return True if an entity was removed.
     */
    bool remove() const;

    /**
     * @brief Creates the parent directory of the socket if missing.
     * @return True if the directory exists afterwards.
     */
    bool ensureParentDirectory() const;

private:
    std::filesystem::path path_;
};

} // namespace pipeweaver::infra
