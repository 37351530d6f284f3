#include "infrastructure/network/LivenessClient.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pipeweaver::infra {

namespace {

constexpr size_t DISCARD_CHUNK_SIZE = 4096;

} // namespace

LivenessClient::LivenessClient(std::string url, MessageRelay& relay)
    : url_(std::move(url)), relay_(relay), rng_(std::random_device{}()) {}

LivenessClient::~LivenessClient() {
    stop();
}

std::future<core::LivenessResult> LivenessClient::start() {
    std::promise<core::LivenessResult> result;
    auto future = result.get_future();

    if (worker_.joinable()) {
        spdlog::warn("Liveness client already started");
        result.set_value(core::LivenessResult::failed("Liveness client already started"));
        return future;
    }

    stopRequested_.store(false);
    worker_ = std::thread(&LivenessClient::run, this, std::move(result));
    return future;
}

void LivenessClient::stop() {
    stopRequested_.store(true);
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        if (activeSocket_) {
            asio::error_code ec;
            activeSocket_->shutdown(Tcp::socket::shutdown_both, ec);
        }
    }

    if (worker_.joinable()) {
        worker_.join();
    }
}

std::string LivenessClient::disconnectReasonToString(DisconnectReason reason) {
    switch (reason) {
    case DisconnectReason::CloseFrame:
        return "close frame";
    case DisconnectReason::ConnectionClosed:
        return "connection closed";
    case DisconnectReason::ProtocolError:
        return "protocol error";
    case DisconnectReason::IoError:
        return "I/O error";
    case DisconnectReason::Stopped:
        return "stopped";
    }
    return "unknown";
}

core::LivenessResult LivenessClient::awaitResult(std::future<core::LivenessResult>& result) {
    try {
        return result.get();
    } catch (const std::future_error& e) {
        return core::LivenessResult::failed(std::string("Liveness channel dropped: ") + e.what());
    }
}

void LivenessClient::run(std::promise<core::LivenessResult> result) {
    bool reported = false;
    auto report = [&](core::LivenessResult value) {
        if (!reported) {
            reported = true;
            result.set_value(std::move(value));
        }
    };

    auto target = WebSocketCodec::parseUrl(url_);
    if (!target) {
        report(core::LivenessResult::failed("Invalid WebSocket URL: " + url_));
        return;
    }

    asio::io_context io;
    auto socket = std::make_shared<Tcp::socket>(io);
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        if (stopRequested_.load()) {
            report(core::LivenessResult::failed("Liveness client stopped"));
            return;
        }
        activeSocket_ = socket;
    }

    auto release = [this, &socket]() {
        std::lock_guard<std::mutex> lock(socketMutex_);
        asio::error_code ec;
        socket->close(ec);
        activeSocket_.reset();
    };

    spdlog::info("Attempting to connect to Pipeweaver at {}", target->toString());
    try {
        connect(*socket, *target);
    } catch (const std::exception& e) {
        spdlog::debug("Liveness connection to {} failed: {}", target->toString(), e.what());
        release();
        report(core::LivenessResult::failed(e.what()));
        return;
    }

    connected_.store(true);
    report(core::LivenessResult::connected());

    DisconnectReason reason = DisconnectReason::IoError;
    try {
        reason = readLoop(*socket);
    } catch (const std::exception& e) {
        spdlog::error("Disconnected: other error: {}", e.what());
    }

    connected_.store(false);
    release();

    spdlog::info("Connection to Pipeweaver Lost ({}), sending Close",
                 disconnectReasonToString(reason));
    relay_.send(core::WindowMessage::Close);
}

void LivenessClient::connect(Tcp::socket& socket, const WebSocketUrl& target) {
    Tcp::resolver resolver(socket.get_executor());
    auto endpoints = resolver.resolve(target.host, target.port);
    asio::connect(socket, endpoints);

    {
        // A stop() that ran before the socket was opened had nothing to shut down.
        std::lock_guard<std::mutex> lock(socketMutex_);
        if (stopRequested_.load()) {
            throw std::runtime_error("Liveness client stopped");
        }
    }

    auto clientKey = WebSocketCodec::generateClientKey(rng_);
    asio::write(socket, asio::buffer(WebSocketCodec::buildHandshakeRequest(target, clientKey)));

    auto response = readHandshakeResponse(socket);
    auto error = WebSocketCodec::validateHandshakeResponse(response, clientKey);
    if (!error.empty()) {
        throw std::runtime_error("WebSocket handshake failed: " + error);
    }

    spdlog::info("Connected, HTTP status: {}", response.substr(0, response.find("\r\n")));
}

std::string LivenessClient::readHandshakeResponse(Tcp::socket& socket) {
    // Byte-wise so no frame data following the headers is consumed.
    std::string response;
    response.reserve(512);
    char ch = 0;

    while (true) {
        asio::error_code ec;
        asio::read(socket, asio::buffer(&ch, 1), ec);
        if (ec) {
            throw std::runtime_error("WebSocket handshake read error: " + ec.message());
        }

        response.push_back(ch);
        if (response.size() >= 4 && response.compare(response.size() - 4, 4, "\r\n\r\n") == 0) {
            return response;
        }
        if (response.size() > WebSocketCodec::MAX_HANDSHAKE_SIZE) {
            throw std::runtime_error("WebSocket handshake response too large");
        }
    }
}

LivenessClient::DisconnectReason LivenessClient::readLoop(Tcp::socket& socket) {
    while (true) {
        asio::error_code ec;
        std::array<uint8_t, 2> base{};
        asio::read(socket, asio::buffer(base), ec);
        if (ec) {
            return classify(ec);
        }

        try {
            auto header = WebSocketCodec::decodeHeader(base[0], base[1]);
            uint64_t length = header.payloadLength;

            if (header.extendedLengthBytes() > 0) {
                std::vector<uint8_t> extended(header.extendedLengthBytes());
                asio::read(socket, asio::buffer(extended), ec);
                if (ec) {
                    return classify(ec);
                }
                length = WebSocketCodec::decodeExtendedLength(header, extended);
            }

            if (!header.isControl()) {
                if (!discardPayload(socket, length, ec)) {
                    return classify(ec);
                }
                continue;
            }

            std::vector<uint8_t> payload(static_cast<size_t>(length));
            if (!payload.empty()) {
                asio::read(socket, asio::buffer(payload), ec);
                if (ec) {
                    return classify(ec);
                }
            }

            switch (header.opcode) {
            case WsOpcode::Ping:
                sendControlFrame(socket, WsOpcode::Pong, payload);
                break;
            case WsOpcode::Close: {
                auto code = WebSocketCodec::closeCode(payload);
                spdlog::info("Server closed the connection (code {})", code ? *code : 0);
                std::vector<uint8_t> reply;
                if (code) {
                    reply.assign(payload.begin(), payload.begin() + 2);
                }
                sendControlFrame(socket, WsOpcode::Close, reply);
                return DisconnectReason::CloseFrame;
            }
            default:
                break;
            }
        } catch (const WebSocketProtocolError& e) {
            spdlog::error("Disconnected: protocol error: {}", e.what());
            return DisconnectReason::ProtocolError;
        }
    }
}

LivenessClient::DisconnectReason LivenessClient::classify(const asio::error_code& ec) const {
    if (stopRequested_.load()) {
        spdlog::debug("Liveness read interrupted by stop: {}", ec.message());
        return DisconnectReason::Stopped;
    }

    if (ec == asio::error::eof || ec == asio::error::connection_reset ||
        ec == asio::error::connection_aborted || ec == asio::error::broken_pipe ||
        ec == asio::error::shut_down || ec == asio::error::not_connected) {
        spdlog::error("Disconnected: connection closed");
        return DisconnectReason::ConnectionClosed;
    }

    spdlog::error("Disconnected: other error: {}", ec.message());
    return DisconnectReason::IoError;
}

void LivenessClient::sendControlFrame(Tcp::socket& socket, WsOpcode opcode,
                                      const std::vector<uint8_t>& payload) {
    auto frame = WebSocketCodec::encodeClientFrame(opcode, payload, WebSocketCodec::generateMask(rng_));

    asio::error_code ec;
    asio::write(socket, asio::buffer(frame), ec);
    if (ec) {
        spdlog::warn("Failed to send {} frame: {}", WebSocketCodec::opcodeToString(opcode),
                     ec.message());
    }
}

bool LivenessClient::discardPayload(Tcp::socket& socket, uint64_t length, asio::error_code& ec) {
    std::array<uint8_t, DISCARD_CHUNK_SIZE> buffer{};
    while (length > 0) {
        size_t chunk = static_cast<size_t>(std::min<uint64_t>(length, buffer.size()));
        asio::read(socket, asio::buffer(buffer.data(), chunk), ec);
        if (ec) {
            return false;
        }
        length -= chunk;
    }
    return true;
}

} // namespace pipeweaver::infra
