#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "common/Result.hpp"
#include "interfaces/INetworkSocket.hpp"

namespace core {
namespace network {

    /**
     * @brief WebSocket frame opcodes
     */
    enum class WsOpcode : uint8_t {
        CONTINUATION = 0x0,
        TEXT = 0x1,
        BINARY = 0x2,
        CLOSE = 0x8,
        PING = 0x9,
        PONG = 0xA
    };

    // Control channel messages are small; anything larger is refused
    constexpr size_t MAX_MESSAGE_SIZE = 1024 * 1024;

    struct WsMessage {
        WsOpcode opcode = WsOpcode::TEXT;
        std::string payload;
    };

    namespace crypto {
        std::string sha1(const std::string& input);
        std::string base64_encode(const std::string& input);
        std::string compute_accept_key(const std::string& client_key);
    }

    // Point in time a read must finish by; nullopt waits indefinitely
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    // ========== Raw IO ==========

    common::EmptyResult send_all(INetworkSocket& socket, const uint8_t* data, size_t size);

    // Timeout when the deadline passes before `size` bytes arrived
    common::EmptyResult recv_exact(INetworkSocket& socket, uint8_t* data, size_t size,
                                   const Deadline& deadline = std::nullopt);

    // ========== Framing ==========

    // One FIN frame. Clients must mask, servers must not.
    std::vector<uint8_t> encode_frame(WsOpcode opcode, const std::string& payload, bool mask);

    common::EmptyResult send_frame(INetworkSocket& socket, WsOpcode opcode,
                                   const std::string& payload, bool mask);

    // Read the next complete message. Fragmented data frames are reassembled;
    // control frames (CLOSE/PING/PONG) are returned as they arrive.
    // TransportError on EOF or socket failure, ProtocolError on a frame
    // larger than MAX_MESSAGE_SIZE or a malformed sequence, Timeout when the
    // message is not complete by `deadline`.
    common::Result<WsMessage> read_message(INetworkSocket& socket, const Deadline& deadline = std::nullopt);

    // ========== Opening handshake ==========

    // Read the HTTP upgrade request and answer 101 Switching Protocols
    common::EmptyResult server_handshake(INetworkSocket& socket, const Deadline& deadline = std::nullopt);

    // Send the upgrade request and verify the server's accept key
    common::EmptyResult client_handshake(INetworkSocket& socket, const std::string& host, uint16_t port);

} // namespace network
} // namespace core
