#pragma once

#include "core/types/LivenessResult.hpp"
#include "infrastructure/ipc/MessageRelay.hpp"
#include "infrastructure/network/WebSocketCodec.hpp"

#include <asio.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>

namespace pipeweaver::infra {

/**
 * @brief Watchdog connection to the remote Pipeweaver service.
 *
 * Opens a WebSocket connection on a dedicated thread and reports whether it
 * succeeded exactly once through the future returned by start(). After a
 * successful connect the thread blocks reading frames, answering pings, until
 * the connection ends for any reason. The end of the connection is turned into
 * a core::WindowMessage::Close on the relay, so losing the remote service shuts
 * the UI down.
 *
 * Payload frames are not interpreted.
 *
 * @note This class is non-copyable. Never touches UI state.
 */
class LivenessClient {
public:
    /**
     * @brief Why the read loop ended.
     */
    enum class DisconnectReason {
        CloseFrame,       ///< Server sent a close frame
        ConnectionClosed, ///< Connection closed without a close frame
        ProtocolError,    ///< Server violated the framing rules
        IoError,          ///< Any other read or write failure
        Stopped           ///< stop() was called
    };

    /**
     * @brief Constructs a client.
     * @param url ws:// URL of the remote endpoint.
     * @param relay Relay receiving the Close message on disconnect.
     */
    LivenessClient(std::string url, MessageRelay& relay);

    /**
     * @brief Destructor. Stops the worker if running.
     */
    ~LivenessClient();

    LivenessClient(const LivenessClient&) = delete;
    LivenessClient& operator=(const LivenessClient&) = delete;

    /**
     * @brief Spawns the worker thread and starts the single connection attempt.
     * @return Future receiving the one-shot liveness result.
     */
    std::future<core::LivenessResult> start();

    /**
     * @brief Shuts the connection down and joins the worker.
     */
    void stop();

    /**
     * @brief Checks whether the connection is currently established.
     */
    bool isConnected() const { return connected_.load(); }

    const std::string& url() const { return url_; }

    static std::string disconnectReasonToString(DisconnectReason reason);

    /**
     * @brief Waits for the one-shot result of a started client.
     *
     * A result channel abandoned without a value counts as failure.
     */
    static core::LivenessResult awaitResult(std::future<core::LivenessResult>& result);

private:
    using Tcp = asio::ip::tcp;

    void run(std::promise<core::LivenessResult> result);
    void connect(Tcp::socket& socket, const WebSocketUrl& target);
    std::string readHandshakeResponse(Tcp::socket& socket);
    DisconnectReason readLoop(Tcp::socket& socket);
    DisconnectReason classify(const asio::error_code& ec) const;
    void sendControlFrame(Tcp::socket& socket, WsOpcode opcode, const std::vector<uint8_t>& payload);
    bool discardPayload(Tcp::socket& socket, uint64_t length, asio::error_code& ec);

    std::string url_;
    MessageRelay& relay_;
    std::mt19937 rng_;

    std::thread worker_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> connected_{false};

    std::mutex socketMutex_;
    std::shared_ptr<Tcp::socket> activeSocket_;
};

} // namespace pipeweaver::infra
