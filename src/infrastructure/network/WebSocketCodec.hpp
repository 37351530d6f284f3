#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace pipeweaver::infra {

/**
 * @brief WebSocket frame opcodes (RFC 6455, section 5.2).
 */
enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA
};

/**
 * @brief Target of a ws:// connection.
 */
struct WebSocketUrl {
    std::string host;      ///< Host name or address
    std::string port;      ///< TCP port as a service string
    std::string path;      ///< Request path, always starts with '/'

    std::string toString() const;

    bool operator==(const WebSocketUrl& other) const = default;
};

/**
 * @brief Decoded fixed part of a frame header.
 *
 * payloadLength holds the 7-bit length field. Values 126 and 127 mean the
 * real length follows in 2 or 8 extended bytes.
 */
struct WsFrameHeader {
    bool fin{true};
    WsOpcode opcode{WsOpcode::Text};
    bool masked{false};
    uint8_t payloadLength{0};

    [[nodiscard]] bool isControl() const { return (static_cast<uint8_t>(opcode) & 0x8) != 0; }

    /**
     * @brief Number of extended length bytes following the base header.
     */
    [[nodiscard]] size_t extendedLengthBytes() const;
};

/**
 * @brief Raised when the peer violates the WebSocket framing rules.
 */
class WebSocketProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Client-side WebSocket handshake and framing helpers.
 *
 * Covers only what a liveness client needs: the HTTP upgrade, decoding of
 * server frame headers and encoding of masked control frames.
 */
class WebSocketCodec {
public:
    static constexpr size_t MAX_CONTROL_PAYLOAD = 125;
    static constexpr size_t MAX_HANDSHAKE_SIZE = 16 * 1024;

    /**
     * @brief Parses a ws:// URL.
     * @param url URL such as "ws://localhost:14565/api/websocket".
     * @return Parsed target, or nullopt for other schemes or an empty host.
     */
    static std::optional<WebSocketUrl> parseUrl(const std::string& url);

    /**
     * @brief Generates a random Sec-WebSocket-Key.
     * @param rng Random source.
     * @return Base64 encoding of 16 random bytes.
     */
    static std::string generateClientKey(std::mt19937& rng);

    /**
     * @brief Computes the Sec-WebSocket-Accept value expected for a key.
     * @param clientKey Key sent in the upgrade request.
     * @return Base64 SHA-1 of the key and the RFC 6455 GUID.
     */
    static std::string computeAcceptKey(const std::string& clientKey);

    /**
     * @brief Builds the HTTP/1.1 upgrade request.
     */
    static std::string buildHandshakeRequest(const WebSocketUrl& url, const std::string& clientKey);

    /**
     * @brief Validates the server's upgrade response headers.
     * @param response Status line and headers, up to and including the blank line.
     * @param clientKey Key sent in the request.
     * @return Empty string on success, otherwise a description of the failure.
     */
    static std::string validateHandshakeResponse(const std::string& response,
                                                 const std::string& clientKey);

    /**
     * @brief Decodes the two fixed header bytes of a server frame.
     * @throws WebSocketProtocolError on reserved bits, unknown opcodes, masked
     *         server frames or malformed control frames.
     */
    static WsFrameHeader decodeHeader(uint8_t first, uint8_t second);

    /**
     * @brief Decodes the extended payload length.
     * @param header Decoded base header.
     * @param extended The 2 or 8 extended length bytes, big-endian.
     * @throws WebSocketProtocolError if the most significant bit is set.
     */
    static uint64_t decodeExtendedLength(const WsFrameHeader& header,
                                         const std::vector<uint8_t>& extended);

    /**
     * @brief Encodes a masked client frame.
     * @param opcode Frame opcode.
     * @param payload Unmasked payload.
     * @param mask Masking key.
     * @return Complete frame bytes ready to send.
     */
    static std::vector<uint8_t> encodeClientFrame(WsOpcode opcode,
                                                  const std::vector<uint8_t>& payload,
                                                  const std::array<uint8_t, 4>& mask);

    /**
     * @brief Generates a random masking key.
     */
    static std::array<uint8_t, 4> generateMask(std::mt19937& rng);

    /**
     * @brief Extracts the status code from a close frame payload.
     * @return The code, or nullopt if the payload carries none.
     */
    static std::optional<uint16_t> closeCode(const std::vector<uint8_t>& payload);

    static std::string opcodeToString(WsOpcode opcode);
};

} // namespace pipeweaver::infra
