#include "infrastructure/ipc/ControlListener.hpp"

#include "core/types/ControlRequest.hpp"
#include "infrastructure/ipc/ControlClient.hpp"

#include <spdlog/spdlog.h>

#include <poll.h>

#include <array>
#include <cerrno>
#include <utility>

namespace pipeweaver::infra {

namespace {

// A control request is a short literal; anything longer is not one of ours.
constexpr size_t MAX_MESSAGE_SIZE = 4096;
constexpr std::chrono::milliseconds READ_TIMEOUT{1000};

} // namespace

ControlListener::ControlListener(RendezvousAddress address, MessageRelay& relay,
                                 std::chrono::milliseconds idleBackoff)
    : address_(std::move(address)), relay_(relay),
      idleBackoff_(idleBackoff.count() > 0 ? idleBackoff : std::chrono::milliseconds(1)) {}

ControlListener::~ControlListener() {
    stop();
}

std::future<ControlListener::BindStatus> ControlListener::start() {
    std::promise<BindStatus> bindResult;
    auto future = bindResult.get_future();

    if (started_.exchange(true)) {
        spdlog::warn("IPC listener already started");
        bindResult.set_value(BindStatus::Failed);
        return future;
    }

    stopRequested_.store(false);
    worker_ = std::thread(&ControlListener::run, this, std::move(bindResult));
    return future;
}

void ControlListener::stop() {
    stopRequested_.store(true);
    if (worker_.joinable()) {
        worker_.join();
    }
    started_.store(false);
}

std::string ControlListener::bindStatusToString(BindStatus status) {
    switch (status) {
    case BindStatus::Bound:
        return "Bound";
    case BindStatus::AddressInUse:
        return "AddressInUse";
    case BindStatus::Failed:
        return "Failed";
    }
    return "Unknown";
}

void ControlListener::run(std::promise<BindStatus> bindResult) {
    spdlog::debug("Spawning IPC Socket Handler");

    asio::io_context io;
    LocalProtocol::acceptor acceptor(io);

    BindStatus status = BindStatus::Failed;
    try {
        status = bind(acceptor);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to bind to socket: {}", e.what());
    }
    bindResult.set_value(status);
    if (status != BindStatus::Bound) {
        return;
    }

    spdlog::debug("IPC listener started at {}", address_.path().string());
    running_.store(true);
    acceptLoop(io, acceptor);
    running_.store(false);

    asio::error_code ec;
    acceptor.close(ec);
    address_.remove();
    spdlog::debug("IPC Socket closed (thread)");
}

ControlListener::BindStatus ControlListener::bind(LocalProtocol::acceptor& acceptor) {
    if (!address_.ensureParentDirectory()) {
        spdlog::warn("Failed to Open IPC Socket");
        return BindStatus::Failed;
    }

    asio::error_code ec;
    LocalProtocol::endpoint endpoint(address_.path().string());

    acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        spdlog::warn("Failed to create IPC socket: {}", ec.message());
        return BindStatus::Failed;
    }

    acceptor.bind(endpoint, ec);
    if (ec == asio::error::address_in_use) {
        if (ControlClient(address_).probe()) {
            spdlog::warn("Another instance is already listening at {}", address_.path().string());
            return BindStatus::AddressInUse;
        }

        spdlog::debug("Removing stale socket file {}", address_.path().string());
        address_.remove();
        ec.clear();
        acceptor.bind(endpoint, ec);
    }

    if (ec) {
        spdlog::warn("Failed to bind to socket: {}", ec.message());
        return ec == asio::error::address_in_use ? BindStatus::AddressInUse : BindStatus::Failed;
    }

    // From here on the socket file is ours and must be removed on failure.
    acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (!ec) {
        acceptor.non_blocking(true, ec);
    }
    if (ec) {
        spdlog::warn("Failed to listen on socket: {}", ec.message());
        acceptor.close(ec);
        address_.remove();
        return BindStatus::Failed;
    }

    return BindStatus::Bound;
}

void ControlListener::acceptLoop(asio::io_context& io, LocalProtocol::acceptor& acceptor) {
    while (!stopRequested_.load()) {
        LocalProtocol::socket socket(io);
        asio::error_code ec;
        acceptor.accept(socket, ec);

        if (!ec) {
            handleConnection(socket);
            continue;
        }

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            std::this_thread::sleep_for(idleBackoff_);
            continue;
        }

        if (ec == asio::error::interrupted || ec == asio::error::connection_aborted) {
            continue;
        }

        spdlog::warn("Unexpected socket error: {}", ec.message());
        break;
    }
}

void ControlListener::handleConnection(LocalProtocol::socket& socket) {
    asio::error_code ec;
    auto message = readMessage(socket, ec);
    socket.close(ec);

    if (!message) {
        return;
    }

    auto request = core::ControlRequest::parse(*message);
    if (!request) {
        spdlog::warn("Ignoring unknown IPC message ({} bytes)", message->size());
        return;
    }

    auto windowMessage = request->toWindowMessage();
    spdlog::debug("Received IPC request, sending {}", core::windowMessageToString(windowMessage));
    relay_.send(windowMessage);
}

std::optional<std::string> ControlListener::readMessage(LocalProtocol::socket& socket,
                                                        asio::error_code& ec) {
    // The accepted socket is polled manually so a silent client cannot stall the loop.
    socket.non_blocking(true, ec);
    if (ec) {
        spdlog::warn("Failed to read message from stream: {}", ec.message());
        return std::nullopt;
    }

    std::string message;
    std::array<char, 512> buffer{};
    auto deadline = std::chrono::steady_clock::now() + READ_TIMEOUT;

    while (true) {
        size_t n = socket.read_some(asio::buffer(buffer), ec);
        if (!ec) {
            message.append(buffer.data(), n);
            if (message.size() > MAX_MESSAGE_SIZE) {
                spdlog::warn("Discarding oversized IPC message");
                return std::nullopt;
            }
            continue;
        }

        if (ec == asio::error::eof) {
            ec.clear();
            return message;
        }

        if (ec != asio::error::would_block && ec != asio::error::try_again &&
            ec != asio::error::interrupted) {
            spdlog::warn("Failed to read message from stream: {}", ec.message());
            return std::nullopt;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            spdlog::warn("Failed to read message from stream: timed out");
            return std::nullopt;
        }

        pollfd pfd{};
        pfd.fd = socket.native_handle();
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, static_cast<int>(remaining.count())) < 0 && errno != EINTR) {
            spdlog::warn("Failed to read message from stream: poll failed ({})", errno);
            return std::nullopt;
        }
    }
}

} // namespace pipeweaver::infra
