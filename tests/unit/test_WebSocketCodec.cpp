#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/WebSocketCodec.hpp"

#include <random>
#include <string>
#include <vector>

using namespace pipeweaver::infra;

TEST_CASE("WebSocketCodec URL parsing", "[WebSocketCodec]") {
    SECTION("Parses host, port and path") {
        auto url = WebSocketCodec::parseUrl("ws://localhost:14565/api/websocket");

        REQUIRE(url.has_value());
        REQUIRE(url->host == "localhost");
        REQUIRE(url->port == "14565");
        REQUIRE(url->path == "/api/websocket");
        REQUIRE(url->toString() == "ws://localhost:14565/api/websocket");
    }

    SECTION("Defaults to port 80 and root path") {
        auto url = WebSocketCodec::parseUrl("ws://example.org");

        REQUIRE(url.has_value());
        REQUIRE(url->port == "80");
        REQUIRE(url->path == "/");
    }

    SECTION("Rejects other schemes") {
        REQUIRE_FALSE(WebSocketCodec::parseUrl("wss://localhost:14565/api/websocket").has_value());
        REQUIRE_FALSE(WebSocketCodec::parseUrl("http://localhost:14565/").has_value());
        REQUIRE_FALSE(WebSocketCodec::parseUrl("localhost:14565").has_value());
    }

    SECTION("Rejects an empty host or a non-numeric port") {
        REQUIRE_FALSE(WebSocketCodec::parseUrl("ws://:14565/api").has_value());
        REQUIRE_FALSE(WebSocketCodec::parseUrl("ws://localhost:http/api").has_value());
    }
}

TEST_CASE("WebSocketCodec handshake", "[WebSocketCodec]") {
    SECTION("Accept key matches the RFC 6455 example") {
        REQUIRE(WebSocketCodec::computeAcceptKey("dGhlIHNhbXBsZSBub25jZQ==") ==
                "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
    }

    SECTION("Client keys are base64 of 16 bytes") {
        std::mt19937 rng(7);
        auto key = WebSocketCodec::generateClientKey(rng);

        REQUIRE(key.size() == 24);
        REQUIRE(key.substr(22) == "==");
        REQUIRE(key != WebSocketCodec::generateClientKey(rng));
    }

    SECTION("Request carries the upgrade headers") {
        WebSocketUrl url{"localhost", "14565", "/api/websocket"};
        auto request = WebSocketCodec::buildHandshakeRequest(url, "abc==");

        REQUIRE(request.rfind("GET /api/websocket HTTP/1.1\r\n", 0) == 0);
        REQUIRE(request.find("Host: localhost:14565\r\n") != std::string::npos);
        REQUIRE(request.find("Upgrade: websocket\r\n") != std::string::npos);
        REQUIRE(request.find("Connection: Upgrade\r\n") != std::string::npos);
        REQUIRE(request.find("Sec-WebSocket-Key: abc==\r\n") != std::string::npos);
        REQUIRE(request.find("Sec-WebSocket-Version: 13\r\n") != std::string::npos);
        REQUIRE(request.substr(request.size() - 4) == "\r\n\r\n");
    }
}

TEST_CASE("WebSocketCodec handshake response validation", "[WebSocketCodec]") {
    const std::string key = "dGhlIHNhbXBsZSBub25jZQ==";

    SECTION("Accepts a valid 101 response") {
        std::string response = "HTTP/1.1 101 Switching Protocols\r\n"
                               "upgrade: WebSocket\r\n"
                               "Connection: Upgrade\r\n"
                               "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n\r\n";

        REQUIRE(WebSocketCodec::validateHandshakeResponse(response, key).empty());
    }

    SECTION("Rejects a non-101 status") {
        std::string response = "HTTP/1.1 404 Not Found\r\n\r\n";

        REQUIRE(WebSocketCodec::validateHandshakeResponse(response, key) ==
                "Unexpected HTTP status 404");
    }

    SECTION("Rejects a wrong accept key") {
        std::string response = "HTTP/1.1 101 Switching Protocols\r\n"
                               "Upgrade: websocket\r\n"
                               "Sec-WebSocket-Accept: AAAAAAAAAAAAAAAAAAAAAAAAAAA=\r\n\r\n";

        REQUIRE(WebSocketCodec::validateHandshakeResponse(response, key) ==
                "Sec-WebSocket-Accept mismatch");
    }

    SECTION("Rejects missing headers") {
        std::string noUpgrade = "HTTP/1.1 101 Switching Protocols\r\n"
                                "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n\r\n";
        std::string noAccept = "HTTP/1.1 101 Switching Protocols\r\n"
                               "Upgrade: websocket\r\n\r\n";

        REQUIRE_FALSE(WebSocketCodec::validateHandshakeResponse(noUpgrade, key).empty());
        REQUIRE_FALSE(WebSocketCodec::validateHandshakeResponse(noAccept, key).empty());
    }

    SECTION("Rejects non-HTTP responses") {
        REQUIRE(WebSocketCodec::validateHandshakeResponse("SSH-2.0-OpenSSH\r\n\r\n", key) ==
                "Malformed handshake response");
    }
}

TEST_CASE("WebSocketCodec frame header decoding", "[WebSocketCodec]") {
    SECTION("Decodes an unmasked ping") {
        auto header = WebSocketCodec::decodeHeader(0x89, 0x04);

        REQUIRE(header.fin);
        REQUIRE(header.opcode == WsOpcode::Ping);
        REQUIRE_FALSE(header.masked);
        REQUIRE(header.payloadLength == 4);
        REQUIRE(header.isControl());
    }

    SECTION("Allows fragmented data frames") {
        auto header = WebSocketCodec::decodeHeader(0x01, 0x7E);

        REQUIRE_FALSE(header.fin);
        REQUIRE(header.opcode == WsOpcode::Text);
        REQUIRE_FALSE(header.isControl());
        REQUIRE(header.extendedLengthBytes() == 2);
    }

    SECTION("Rejects reserved bits") {
        REQUIRE_THROWS_AS(WebSocketCodec::decodeHeader(0xC1, 0x00), WebSocketProtocolError);
    }

    SECTION("Rejects unknown opcodes") {
        REQUIRE_THROWS_AS(WebSocketCodec::decodeHeader(0x83, 0x00), WebSocketProtocolError);
        REQUIRE_THROWS_AS(WebSocketCodec::decodeHeader(0x8B, 0x00), WebSocketProtocolError);
    }

    SECTION("Rejects masked server frames") {
        REQUIRE_THROWS_AS(WebSocketCodec::decodeHeader(0x81, 0x85), WebSocketProtocolError);
    }

    SECTION("Rejects malformed control frames") {
        REQUIRE_THROWS_AS(WebSocketCodec::decodeHeader(0x09, 0x00), WebSocketProtocolError);
        REQUIRE_THROWS_AS(WebSocketCodec::decodeHeader(0x89, 0x7E), WebSocketProtocolError);
    }
}

TEST_CASE("WebSocketCodec extended lengths", "[WebSocketCodec]") {
    SECTION("16-bit length") {
        auto header = WebSocketCodec::decodeHeader(0x82, 126);
        REQUIRE(WebSocketCodec::decodeExtendedLength(header, {0x01, 0x00}) == 256);
    }

    SECTION("64-bit length") {
        auto header = WebSocketCodec::decodeHeader(0x82, 127);
        REQUIRE(WebSocketCodec::decodeExtendedLength(header, {0, 0, 0, 0, 0, 1, 0, 0}) == 65536);
    }

    SECTION("64-bit length with the top bit set is rejected") {
        auto header = WebSocketCodec::decodeHeader(0x82, 127);
        REQUIRE_THROWS_AS(WebSocketCodec::decodeExtendedLength(header, {0x80, 0, 0, 0, 0, 0, 0, 1}),
                          WebSocketProtocolError);
    }

    SECTION("Wrong number of extended bytes is rejected") {
        auto header = WebSocketCodec::decodeHeader(0x82, 126);
        REQUIRE_THROWS_AS(WebSocketCodec::decodeExtendedLength(header, {0x01}),
                          WebSocketProtocolError);
    }
}

TEST_CASE("WebSocketCodec client frame encoding", "[WebSocketCodec]") {
    const std::array<uint8_t, 4> mask{0x01, 0x02, 0x03, 0x04};

    SECTION("Pong frame is final, masked and carries the payload") {
        auto frame = WebSocketCodec::encodeClientFrame(WsOpcode::Pong, {'a', 'b'}, mask);

        REQUIRE(frame == std::vector<uint8_t>{0x8A, 0x82, 0x01, 0x02, 0x03, 0x04,
                                              'a' ^ 0x01, 'b' ^ 0x02});
    }

    SECTION("Empty close frame") {
        auto frame = WebSocketCodec::encodeClientFrame(WsOpcode::Close, {}, mask);

        REQUIRE(frame == std::vector<uint8_t>{0x88, 0x80, 0x01, 0x02, 0x03, 0x04});
    }

    SECTION("Payloads of 126 bytes and more use the 16-bit length") {
        std::vector<uint8_t> payload(300, 0);
        auto frame = WebSocketCodec::encodeClientFrame(WsOpcode::Binary, payload, mask);

        REQUIRE(frame[1] == (0x80 | 126));
        REQUIRE(frame[2] == 0x01);
        REQUIRE(frame[3] == 0x2C);
        REQUIRE(frame.size() == 2 + 2 + 4 + 300);
    }
}

TEST_CASE("WebSocketCodec close codes", "[WebSocketCodec]") {
    REQUIRE(WebSocketCodec::closeCode({0x03, 0xE8}) == 1000);
    REQUIRE(WebSocketCodec::closeCode({0x03, 0xE9, 'b', 'y', 'e'}) == 1001);
    REQUIRE_FALSE(WebSocketCodec::closeCode({}).has_value());
    REQUIRE_FALSE(WebSocketCodec::closeCode({0x03}).has_value());
}
