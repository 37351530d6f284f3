#pragma once

#include "core/types/ControlRequest.hpp"
#include "infrastructure/ipc/RendezvousAddress.hpp"

#include <asio.hpp>

namespace pipeweaver::infra {

/**
 * @brief Client side of the local control protocol.
 *
 * Makes exactly one connection attempt per call. Requests are written as the
 * raw literal and the connection is closed; no reply is read.
 */
class ControlClient {
public:
    /**
     * @brief Outcome of a send attempt.
     */
    enum class SendStatus {
        Delivered,     ///< Connected and request written
        ConnectFailed, ///< No listener accepted the connection
        WriteFailed    ///< Connected but the write failed
    };

    explicit ControlClient(RendezvousAddress address);

    /**
     * @brief Connects to the listener and writes a request.
     * @param request Request to deliver.
     * @return Delivery status.
     */
    SendStatus send(const core::ControlRequest& request) const;

    /**
     * @brief Checks whether a listener currently accepts connections.
     *
     * Connects and closes without writing. The listener sees an empty body,
     * which it discards.
     *
     * @return True if the connection was accepted.
     */
    bool probe() const;

private:
    asio::local::stream_protocol::endpoint endpoint() const;

    RendezvousAddress address_;
};

} // namespace pipeweaver::infra
