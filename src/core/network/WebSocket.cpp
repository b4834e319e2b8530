#include "core/network/WebSocket.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>
#include <thread>

namespace core {
namespace network {

    // ============================================================================
    // SHA1 / Base64 (handshake only)
    // ============================================================================

    namespace crypto {

        std::string sha1(const std::string& input) {
            uint32_t h0 = 0x67452301;
            uint32_t h1 = 0xEFCDAB89;
            uint32_t h2 = 0x98BADCFE;
            uint32_t h3 = 0x10325476;
            uint32_t h4 = 0xC3D2E1F0;

            std::string msg = input;
            uint64_t bit_len = static_cast<uint64_t>(input.size()) * 8;
            msg.push_back(static_cast<char>(0x80));
            while ((msg.size() % 64) != 56) {
                msg.push_back(0);
            }
            for (int i = 7; i >= 0; --i) {
                msg.push_back(static_cast<char>((bit_len >> (i * 8)) & 0xFF));
            }

            auto rotl = [](uint32_t x, uint32_t n) {
                return (x << n) | (x >> (32 - n));
            };

            for (size_t chunk = 0; chunk < msg.size(); chunk += 64) {
                uint32_t w[80];
                for (int i = 0; i < 16; ++i) {
                    w[i] = (static_cast<uint32_t>(static_cast<uint8_t>(msg[chunk + i * 4])) << 24) |
                           (static_cast<uint32_t>(static_cast<uint8_t>(msg[chunk + i * 4 + 1])) << 16) |
                           (static_cast<uint32_t>(static_cast<uint8_t>(msg[chunk + i * 4 + 2])) << 8) |
                           static_cast<uint32_t>(static_cast<uint8_t>(msg[chunk + i * 4 + 3]));
                }
                for (int i = 16; i < 80; ++i) {
                    w[i] = rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
                }

                uint32_t a = h0, b = h1, c = h2, d = h3, e = h4;
                for (int i = 0; i < 80; ++i) {
                    uint32_t f, k;
                    if (i < 20) {
                        f = (b & c) | ((~b) & d);
                        k = 0x5A827999;
                    } else if (i < 40) {
                        f = b ^ c ^ d;
                        k = 0x6ED9EBA1;
                    } else if (i < 60) {
                        f = (b & c) | (b & d) | (c & d);
                        k = 0x8F1BBCDC;
                    } else {
                        f = b ^ c ^ d;
                        k = 0xCA62C1D6;
                    }
                    uint32_t temp = rotl(a, 5) + f + e + k + w[i];
                    e = d; d = c; c = rotl(b, 30); b = a; a = temp;
                }
                h0 += a; h1 += b; h2 += c; h3 += d; h4 += e;
            }

            std::string digest(20, '\0');
            const uint32_t parts[5] = {h0, h1, h2, h3, h4};
            for (int p = 0; p < 5; ++p) {
                for (int i = 0; i < 4; ++i) {
                    digest[p * 4 + i] = static_cast<char>((parts[p] >> (24 - i * 8)) & 0xFF);
                }
            }
            return digest;
        }

        std::string base64_encode(const std::string& input) {
            static const char table[] =
                "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

            const auto* data = reinterpret_cast<const unsigned char*>(input.data());
            size_t len = input.size();
            std::string out;
            out.reserve(((len + 2) / 3) * 4);

            size_t i = 0;
            while (i + 2 < len) {
                unsigned int triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
                i += 3;
                out.push_back(table[(triple >> 18) & 0x3F]);
                out.push_back(table[(triple >> 12) & 0x3F]);
                out.push_back(table[(triple >> 6) & 0x3F]);
                out.push_back(table[triple & 0x3F]);
            }

            if (i < len) {
                unsigned int triple = data[i] << 16;
                if (i + 1 < len) triple |= data[i + 1] << 8;

                out.push_back(table[(triple >> 18) & 0x3F]);
                out.push_back(table[(triple >> 12) & 0x3F]);
                if (i + 1 < len) {
                    out.push_back(table[(triple >> 6) & 0x3F]);
                    out.push_back('=');
                } else {
                    out.push_back('=');
                    out.push_back('=');
                }
            }
            return out;
        }

        std::string compute_accept_key(const std::string& client_key) {
            static const std::string GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
            return base64_encode(sha1(client_key + GUID));
        }

    } // namespace crypto

    namespace {

        std::string random_bytes(size_t count) {
            static thread_local std::mt19937 rng{std::random_device{}()};
            std::uniform_int_distribution<int> dist(0, 255);
            std::string out(count, '\0');
            for (auto& c : out) c = static_cast<char>(dist(rng));
            return out;
        }

        std::string to_lower(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        // Case-insensitive header lookup in a raw HTTP head
        std::string extract_header(const std::string& head, const std::string& name) {
            std::string lower_head = to_lower(head);
            std::string needle = "\r\n" + to_lower(name) + ":";
            size_t pos = lower_head.find(needle);
            if (pos == std::string::npos) return "";

            pos += needle.size();
            while (pos < head.size() && (head[pos] == ' ' || head[pos] == '\t')) ++pos;

            size_t end = head.find("\r\n", pos);
            if (end == std::string::npos) end = head.size();
            std::string value = head.substr(pos, end - pos);
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.pop_back();
            return value;
        }

        // Read up to and including the blank line. Byte by byte so nothing
        // after the head is consumed.
        common::Result<std::string> read_http_head(INetworkSocket& socket, const Deadline& deadline) {
            static const size_t MAX_HEAD = 8192;
            std::string head;
            uint8_t byte = 0;
            while (head.size() < MAX_HEAD) {
                auto rc = recv_exact(socket, &byte, 1, deadline);
                if (rc.is_err()) return common::Result<std::string>::err(rc.error());
                head.push_back(static_cast<char>(byte));
                if (head.size() >= 4 && head.compare(head.size() - 4, 4, "\r\n\r\n") == 0) {
                    return head;
                }
            }
            return common::Result<std::string>::err(common::ErrorCode::ProtocolError, "HTTP header too large");
        }

        struct FrameHeader {
            bool fin = true;
            WsOpcode opcode = WsOpcode::TEXT;
            uint64_t length = 0;
        };

        common::Result<std::string> read_frame(INetworkSocket& socket, FrameHeader& header,
                                               const Deadline& deadline) {
            uint8_t head[2];
            auto rc = recv_exact(socket, head, 2, deadline);
            if (rc.is_err()) return common::Result<std::string>::err(rc.error());

            header.fin = (head[0] & 0x80) != 0;
            header.opcode = static_cast<WsOpcode>(head[0] & 0x0F);
            bool masked = (head[1] & 0x80) != 0;
            uint64_t length = head[1] & 0x7F;

            if (length == 126) {
                uint8_t ext[2];
                rc = recv_exact(socket, ext, 2, deadline);
                if (rc.is_err()) return common::Result<std::string>::err(rc.error());
                length = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
            } else if (length == 127) {
                uint8_t ext[8];
                rc = recv_exact(socket, ext, 8, deadline);
                if (rc.is_err()) return common::Result<std::string>::err(rc.error());
                length = 0;
                for (int i = 0; i < 8; ++i) {
                    length = (length << 8) | ext[i];
                }
            }

            if (length > MAX_MESSAGE_SIZE) {
                return common::Result<std::string>::err(common::ErrorCode::ProtocolError, "message too large");
            }
            header.length = length;

            uint8_t mask[4] = {0, 0, 0, 0};
            if (masked) {
                rc = recv_exact(socket, mask, 4, deadline);
                if (rc.is_err()) return common::Result<std::string>::err(rc.error());
            }

            std::string payload(static_cast<size_t>(length), '\0');
            if (length > 0) {
                rc = recv_exact(socket, reinterpret_cast<uint8_t*>(&payload[0]), payload.size(), deadline);
                if (rc.is_err()) return common::Result<std::string>::err(rc.error());
            }

            if (masked) {
                for (size_t i = 0; i < payload.size(); ++i) {
                    payload[i] = static_cast<char>(payload[i] ^ mask[i % 4]);
                }
            }
            return payload;
        }

    } // namespace

    // ============================================================================
    // Raw IO
    // ============================================================================

    common::EmptyResult send_all(INetworkSocket& socket, const uint8_t* data, size_t size) {
        size_t sent = 0;
        while (sent < size) {
            auto [n, status] = socket.send(data + sent, size - sent);
            if (status == SocketError::WouldBlock) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            if (status != SocketError::Ok) {
                return common::EmptyResult::err(common::ErrorCode::TransportError, "send failed");
            }
            sent += n;
        }
        return common::EmptyResult::success();
    }

    common::EmptyResult recv_exact(INetworkSocket& socket, uint8_t* data, size_t size,
                                   const Deadline& deadline) {
        size_t received = 0;
        while (received < size) {
            if (deadline) {
                // A blocking recv ignores the deadline; only call it once data is readable
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    *deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    return common::EmptyResult::err(common::ErrorCode::Timeout, "read timed out");
                }
                auto ready = socket.wait_readable(static_cast<int>(std::min<int64_t>(remaining.count(), 1000)));
                if (ready == SocketError::WouldBlock) continue;
                if (ready != SocketError::Ok) {
                    return common::EmptyResult::err(common::ErrorCode::TransportError, "wait failed");
                }
            }

            auto [n, status] = socket.recv(data + received, size - received);
            if (status == SocketError::WouldBlock) {
                if (socket.wait_readable(1000) == SocketError::Fatal) {
                    return common::EmptyResult::err(common::ErrorCode::TransportError, "wait failed");
                }
                continue;
            }
            if (status == SocketError::Disconnected) {
                return common::EmptyResult::err(common::ErrorCode::TransportError, "connection closed");
            }
            if (status != SocketError::Ok) {
                return common::EmptyResult::err(common::ErrorCode::TransportError, "recv failed");
            }
            received += n;
        }
        return common::EmptyResult::success();
    }

    // ============================================================================
    // Framing
    // ============================================================================

    std::vector<uint8_t> encode_frame(WsOpcode opcode, const std::string& payload, bool mask) {
        std::vector<uint8_t> frame;
        size_t len = payload.size();
        frame.reserve(len + 14);

        // First byte: FIN + opcode
        frame.push_back(0x80 | static_cast<uint8_t>(opcode));

        uint8_t mask_bit = mask ? 0x80 : 0x00;
        if (len <= 125) {
            frame.push_back(mask_bit | static_cast<uint8_t>(len));
        } else if (len <= 65535) {
            frame.push_back(mask_bit | 126);
            frame.push_back((len >> 8) & 0xFF);
            frame.push_back(len & 0xFF);
        } else {
            frame.push_back(mask_bit | 127);
            for (int i = 7; i >= 0; --i) {
                frame.push_back((static_cast<uint64_t>(len) >> (i * 8)) & 0xFF);
            }
        }

        if (!mask) {
            frame.insert(frame.end(), payload.begin(), payload.end());
            return frame;
        }

        std::string key = random_bytes(4);
        frame.insert(frame.end(), key.begin(), key.end());
        for (size_t i = 0; i < len; ++i) {
            frame.push_back(static_cast<uint8_t>(payload[i] ^ key[i % 4]));
        }
        return frame;
    }

    common::EmptyResult send_frame(INetworkSocket& socket, WsOpcode opcode,
                                   const std::string& payload, bool mask) {
        auto frame = encode_frame(opcode, payload, mask);
        return send_all(socket, frame.data(), frame.size());
    }

    common::Result<WsMessage> read_message(INetworkSocket& socket, const Deadline& deadline) {
        using MessageResult = common::Result<WsMessage>;

        WsMessage message;
        bool in_fragment = false;

        while (true) {
            FrameHeader header;
            auto payload = read_frame(socket, header, deadline);
            if (payload.is_err()) return MessageResult::err(payload.error());

            auto op = static_cast<uint8_t>(header.opcode);
            if (op >= 0x8) {
                // Control frames may interleave with a fragmented message
                if (!header.fin || payload.unwrap().size() > 125) {
                    return MessageResult::err(common::ErrorCode::ProtocolError, "invalid control frame");
                }
                return WsMessage{header.opcode, payload.take()};
            }

            if (header.opcode == WsOpcode::CONTINUATION) {
                if (!in_fragment) {
                    return MessageResult::err(common::ErrorCode::ProtocolError, "unexpected continuation frame");
                }
            } else if (header.opcode == WsOpcode::TEXT || header.opcode == WsOpcode::BINARY) {
                if (in_fragment) {
                    return MessageResult::err(common::ErrorCode::ProtocolError, "interleaved data frames");
                }
                message.opcode = header.opcode;
                message.payload.clear();
                in_fragment = true;
            } else {
                return MessageResult::err(common::ErrorCode::ProtocolError, "unknown opcode");
            }

            if (message.payload.size() + payload.unwrap().size() > MAX_MESSAGE_SIZE) {
                return MessageResult::err(common::ErrorCode::ProtocolError, "message too large");
            }
            message.payload += payload.unwrap();

            if (header.fin) return message;
        }
    }

    // ============================================================================
    // Opening handshake
    // ============================================================================

    common::EmptyResult server_handshake(INetworkSocket& socket, const Deadline& deadline) {
        auto head = read_http_head(socket, deadline);
        if (head.is_err()) return common::EmptyResult::err(head.error());

        std::string key = extract_header(head.unwrap(), "Sec-WebSocket-Key");
        if (key.empty() || to_lower(extract_header(head.unwrap(), "Upgrade")) != "websocket") {
            std::string response = "HTTP/1.1 400 Bad Request\r\nConnection: close\r\n\r\n";
            auto sent = send_all(socket, reinterpret_cast<const uint8_t*>(response.data()), response.size());
            if (sent.is_err()) return sent;
            return common::EmptyResult::err(common::ErrorCode::ProtocolError, "not a WebSocket upgrade request");
        }

        std::string response =
            "HTTP/1.1 101 Switching Protocols\r\n"
            "Upgrade: websocket\r\n"
            "Connection: Upgrade\r\n"
            "Sec-WebSocket-Accept: " + crypto::compute_accept_key(key) + "\r\n\r\n";
        return send_all(socket, reinterpret_cast<const uint8_t*>(response.data()), response.size());
    }

    common::EmptyResult client_handshake(INetworkSocket& socket, const std::string& host, uint16_t port) {
        std::string key = crypto::base64_encode(random_bytes(16));

        std::string request =
            "GET / HTTP/1.1\r\n"
            "Host: " + host + ":" + std::to_string(port) + "\r\n"
            "Upgrade: websocket\r\n"
            "Connection: Upgrade\r\n"
            "Sec-WebSocket-Key: " + key + "\r\n"
            "Sec-WebSocket-Version: 13\r\n\r\n";

        auto sent = send_all(socket, reinterpret_cast<const uint8_t*>(request.data()), request.size());
        if (sent.is_err()) return sent;

        auto head = read_http_head(socket, Deadline{});
        if (head.is_err()) return common::EmptyResult::err(head.error());

        const std::string& response = head.unwrap();
        if (response.compare(0, 12, "HTTP/1.1 101") != 0) {
            return common::EmptyResult::err(common::ErrorCode::ProtocolError,
                                            "upgrade refused: " + response.substr(0, response.find("\r\n")));
        }
        if (extract_header(response, "Sec-WebSocket-Accept") != crypto::compute_accept_key(key)) {
            return common::EmptyResult::err(common::ErrorCode::ProtocolError, "bad Sec-WebSocket-Accept");
        }
        return common::EmptyResult::success();
    }

} // namespace network
} // namespace core
