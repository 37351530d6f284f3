#pragma once

#include "infrastructure/ipc/RendezvousAddress.hpp"

namespace pipeweaver::app {

/**
 * @brief Detects a running instance for this user session.
 *
 * Run once at process start, before anything else is initialized. When an
 * instance is found it is asked to raise its window and the new process is
 * expected to exit.
 */
class SingleInstance {
public:
    explicit SingleInstance(infra::RendezvousAddress address);

    /**
     * @brief Looks for a listener at the rendezvous address and forwards a
     *        focus request to it.
     *
     * A missing socket file means no instance, without further I/O. A socket
     * file nobody accepts on is stale and is removed. Exactly one connection
     * attempt is made.
     *
     * @return True if a running instance accepted the request.
     */
    bool detectAndForward();

    /**
     * @brief True once detectAndForward() has found a running instance.
     */
    bool isRunning() const { return isRunning_; }

    const infra::RendezvousAddress& address() const { return address_; }

private:
    infra::RendezvousAddress address_;
    bool isRunning_{false};
};

} // namespace pipeweaver::app
