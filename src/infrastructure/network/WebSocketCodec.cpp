#include "infrastructure/network/WebSocketCodec.hpp"

#include <QByteArray>
#include <QCryptographicHash>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace pipeweaver::infra {

namespace {

constexpr char WEBSOCKET_GUID[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<std::string> headerValue(const std::string& response, const std::string& name) {
    std::istringstream stream(response);
    std::string line;
    const std::string target = toLower(name);

    while (std::getline(stream, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (toLower(trim(line.substr(0, colon))) == target) {
            return trim(line.substr(colon + 1));
        }
    }
    return std::nullopt;
}

bool isKnownOpcode(uint8_t value) {
    switch (value) {
    case 0x0:
    case 0x1:
    case 0x2:
    case 0x8:
    case 0x9:
    case 0xA:
        return true;
    default:
        return false;
    }
}

} // namespace

std::string WebSocketUrl::toString() const {
    return "ws://" + host + ":" + port + path;
}

size_t WsFrameHeader::extendedLengthBytes() const {
    if (payloadLength == 126) {
        return 2;
    }
    if (payloadLength == 127) {
        return 8;
    }
    return 0;
}

std::optional<WebSocketUrl> WebSocketCodec::parseUrl(const std::string& url) {
    const std::string scheme = "ws://";
    if (url.rfind(scheme, 0) != 0) {
        return std::nullopt;
    }

    std::string remainder = url.substr(scheme.size());
    auto slash = remainder.find('/');
    std::string authority = slash == std::string::npos ? remainder : remainder.substr(0, slash);
    std::string path = slash == std::string::npos ? "/" : remainder.substr(slash);

    auto colon = authority.rfind(':');
    std::string host = trim(colon == std::string::npos ? authority : authority.substr(0, colon));
    std::string port = trim(colon == std::string::npos ? "" : authority.substr(colon + 1));

    if (host.empty()) {
        return std::nullopt;
    }
    if (port.empty()) {
        port = "80";
    }
    if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    return WebSocketUrl{host, port, path};
}

std::string WebSocketCodec::generateClientKey(std::mt19937& rng) {
    std::uniform_int_distribution<int> dist(0, 255);
    QByteArray nonce(16, '\0');
    for (auto& byte : nonce) {
        byte = static_cast<char>(dist(rng));
    }
    return nonce.toBase64().toStdString();
}

std::string WebSocketCodec::computeAcceptKey(const std::string& clientKey) {
    QByteArray merged = QByteArray::fromStdString(clientKey + WEBSOCKET_GUID);
    return QCryptographicHash::hash(merged, QCryptographicHash::Sha1).toBase64().toStdString();
}

std::string WebSocketCodec::buildHandshakeRequest(const WebSocketUrl& url,
                                                  const std::string& clientKey) {
    std::ostringstream request;
    request << "GET " << url.path << " HTTP/1.1\r\n"
            << "Host: " << url.host << ":" << url.port << "\r\n"
            << "Upgrade: websocket\r\n"
            << "Connection: Upgrade\r\n"
            << "Sec-WebSocket-Key: " << clientKey << "\r\n"
            << "Sec-WebSocket-Version: 13\r\n"
            << "\r\n";
    return request.str();
}

std::string WebSocketCodec::validateHandshakeResponse(const std::string& response,
                                                      const std::string& clientKey) {
    auto statusLine = response.substr(0, response.find("\r\n"));
    std::istringstream status(statusLine);
    std::string version;
    int code = 0;
    status >> version >> code;

    if (version.rfind("HTTP/1.", 0) != 0) {
        return "Malformed handshake response";
    }
    if (code != 101) {
        return "Unexpected HTTP status " + std::to_string(code);
    }

    auto upgrade = headerValue(response, "Upgrade");
    if (!upgrade || toLower(*upgrade) != "websocket") {
        return "Missing Upgrade: websocket header";
    }

    auto accept = headerValue(response, "Sec-WebSocket-Accept");
    if (!accept) {
        return "Missing Sec-WebSocket-Accept header";
    }
    if (*accept != computeAcceptKey(clientKey)) {
        return "Sec-WebSocket-Accept mismatch";
    }

    return {};
}

WsFrameHeader WebSocketCodec::decodeHeader(uint8_t first, uint8_t second) {
    if ((first & 0x70) != 0) {
        throw WebSocketProtocolError("Reserved bits set without negotiated extension");
    }

    uint8_t opcode = first & 0x0F;
    if (!isKnownOpcode(opcode)) {
        throw WebSocketProtocolError("Unknown opcode " + std::to_string(opcode));
    }

    WsFrameHeader header;
    header.fin = (first & 0x80) != 0;
    header.opcode = static_cast<WsOpcode>(opcode);
    header.masked = (second & 0x80) != 0;
    header.payloadLength = second & 0x7F;

    if (header.masked) {
        throw WebSocketProtocolError("Received masked frame from server");
    }
    if (header.isControl()) {
        if (!header.fin) {
            throw WebSocketProtocolError("Fragmented control frame");
        }
        if (header.payloadLength > MAX_CONTROL_PAYLOAD) {
            throw WebSocketProtocolError("Control frame payload too large");
        }
    }

    return header;
}

uint64_t WebSocketCodec::decodeExtendedLength(const WsFrameHeader& header,
                                              const std::vector<uint8_t>& extended) {
    if (extended.size() != header.extendedLengthBytes()) {
        throw WebSocketProtocolError("Invalid extended length size");
    }
    if (extended.empty()) {
        return header.payloadLength;
    }

    uint64_t length = 0;
    for (auto byte : extended) {
        length = (length << 8) | byte;
    }

    if (extended.size() == 8 && (extended[0] & 0x80) != 0) {
        throw WebSocketProtocolError("Payload length has most significant bit set");
    }
    return length;
}

std::vector<uint8_t> WebSocketCodec::encodeClientFrame(WsOpcode opcode,
                                                       const std::vector<uint8_t>& payload,
                                                       const std::array<uint8_t, 4>& mask) {
    std::vector<uint8_t> frame;
    const size_t length = payload.size();
    frame.reserve(2 + 8 + mask.size() + length);

    frame.push_back(static_cast<uint8_t>(0x80 | static_cast<uint8_t>(opcode)));

    if (length < 126) {
        frame.push_back(static_cast<uint8_t>(0x80 | length));
    } else if (length <= 0xFFFF) {
        frame.push_back(0x80 | 126);
        frame.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        frame.push_back(static_cast<uint8_t>(length & 0xFF));
    } else {
        frame.push_back(0x80 | 127);
        for (int i = 7; i >= 0; --i) {
            frame.push_back(static_cast<uint8_t>((static_cast<uint64_t>(length) >> (i * 8)) & 0xFF));
        }
    }

    frame.insert(frame.end(), mask.begin(), mask.end());
    for (size_t i = 0; i < length; ++i) {
        frame.push_back(static_cast<uint8_t>(payload[i] ^ mask[i % 4]));
    }

    return frame;
}

std::array<uint8_t, 4> WebSocketCodec::generateMask(std::mt19937& rng) {
    std::uniform_int_distribution<int> dist(0, 255);
    std::array<uint8_t, 4> mask{};
    for (auto& byte : mask) {
        byte = static_cast<uint8_t>(dist(rng));
    }
    return mask;
}

std::optional<uint16_t> WebSocketCodec::closeCode(const std::vector<uint8_t>& payload) {
    if (payload.size() < 2) {
        return std::nullopt;
    }
    return static_cast<uint16_t>((payload[0] << 8) | payload[1]);
}

std::string WebSocketCodec::opcodeToString(WsOpcode opcode) {
    switch (opcode) {
    case WsOpcode::Continuation:
        return "Continuation";
    case WsOpcode::Text:
        return "Text";
    case WsOpcode::Binary:
        return "Binary";
    case WsOpcode::Close:
        return "Close";
    case WsOpcode::Ping:
        return "Ping";
    case WsOpcode::Pong:
        return "Pong";
    }
    return "Unknown";
}

} // namespace pipeweaver::infra
