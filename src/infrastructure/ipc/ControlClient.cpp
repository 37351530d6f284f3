#include "infrastructure/ipc/ControlClient.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <utility>

namespace pipeweaver::infra {

using LocalProtocol = asio::local::stream_protocol;

namespace {

// Paths longer than sun_path cannot be connected to; map them to an invalid endpoint.
LocalProtocol::endpoint makeEndpoint(const std::string& path) {
    try {
        return LocalProtocol::endpoint(path);
    } catch (const std::exception& e) {
        spdlog::warn("Invalid rendezvous path {}: {}", path, e.what());
        return LocalProtocol::endpoint();
    }
}

} // namespace

ControlClient::ControlClient(RendezvousAddress address) : address_(std::move(address)) {}

asio::local::stream_protocol::endpoint ControlClient::endpoint() const {
    return makeEndpoint(address_.path().string());
}

ControlClient::SendStatus ControlClient::send(const core::ControlRequest& request) const {
    asio::io_context io;
    LocalProtocol::socket socket(io);

    asio::error_code ec;
    socket.connect(endpoint(), ec);
    if (ec) {
        spdlog::debug("Failed to connect to {}: {}", address_.path().string(), ec.message());
        return SendStatus::ConnectFailed;
    }

    auto payload = request.encode();
    asio::write(socket, asio::buffer(payload), ec);
    if (ec) {
        spdlog::warn("Failed to write control request: {}", ec.message());
        return SendStatus::WriteFailed;
    }

    socket.shutdown(LocalProtocol::socket::shutdown_send, ec);
    socket.close(ec);
    return SendStatus::Delivered;
}

bool ControlClient::probe() const {
    asio::io_context io;
    LocalProtocol::socket socket(io);

    asio::error_code ec;
    socket.connect(endpoint(), ec);
    if (ec) {
        return false;
    }

    socket.close(ec);
    return true;
}

} // namespace pipeweaver::infra
