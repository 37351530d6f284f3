#pragma once

#include "infrastructure/ipc/MessageRelay.hpp"
#include "infrastructure/ipc/RendezvousAddress.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <string>
#include <thread>

namespace pipeweaver::infra {

/**
 * @brief Background listener for the local control socket.
 *
 * Binds the session rendezvous address and forwards every well-formed control
 * request to the MessageRelay as a window message. Accept is non-blocking and
 * polled with a fixed idle back-off, so the worker notices stop() within one
 * interval.
 *
 * The socket file is removed on every exit path once the address has been
 * bound. A failed bind never touches an entity owned by another process.
 *
 * @note This class is non-copyable. Never touches UI state.
 */
class ControlListener {
public:
    /**
     * @brief Result of binding the rendezvous address.
     */
    enum class BindStatus {
        Bound,        ///< Address bound, listener accepting
        AddressInUse, ///< A live listener already owns the address
        Failed        ///< Directory, socket, bind or listen failure
    };

    /**
     * @brief Constructs a listener.
     * @param address Rendezvous address to bind.
     * @param relay Relay receiving the produced window messages.
     * @param idleBackoff Sleep between accept attempts when nothing is pending.
     */
    ControlListener(RendezvousAddress address, MessageRelay& relay,
                    std::chrono::milliseconds idleBackoff = std::chrono::milliseconds(100));

    /**
     * @brief Destructor. Stops the worker and releases the address.
     */
    ~ControlListener();

    ControlListener(const ControlListener&) = delete;
    ControlListener& operator=(const ControlListener&) = delete;

    /**
     * @brief Spawns the worker thread.
     * @return Future that becomes ready once the bind has succeeded or failed.
     *         If the listener is already running the future holds Failed.
     */
    std::future<BindStatus> start();

    /**
     * @brief Requests the worker to exit and joins it.
     */
    void stop();

    /**
     * @brief Checks if the worker thread is inside its accept loop.
     */
    bool isRunning() const { return running_.load(); }

    const RendezvousAddress& address() const { return address_; }

    static std::string bindStatusToString(BindStatus status);

private:
    using LocalProtocol = asio::local::stream_protocol;

    void run(std::promise<BindStatus> bindResult);
    BindStatus bind(LocalProtocol::acceptor& acceptor);
    void acceptLoop(asio::io_context& io, LocalProtocol::acceptor& acceptor);
    void handleConnection(LocalProtocol::socket& socket);
    std::optional<std::string> readMessage(LocalProtocol::socket& socket, asio::error_code& ec);

    RendezvousAddress address_;
    MessageRelay& relay_;
    std::chrono::milliseconds idleBackoff_;

    std::thread worker_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> started_{false};
};

} // namespace pipeweaver::infra
