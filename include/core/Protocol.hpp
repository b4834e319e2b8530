#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "common/Result.hpp"

namespace core {
namespace protocol {

    // ========== Constants ==========

    constexpr uint16_t DEFAULT_CONTROL_PORT = 8765;
    constexpr uint16_t DEFAULT_DISCOVERY_PORT = 9876;
    constexpr const char* DISCOVERY_REQUEST = "remotemouse:discover";
    constexpr const char* PROTOCOL_VERSION = "2.0";

    // Error texts the host sends; clients and tests match on them
    constexpr const char* ERR_INVALID_PIN = "invalid pin";
    constexpr const char* ERR_AUTH_REQUIRED = "authentication required";
    constexpr const char* ERR_ALREADY_AUTHENTICATED = "already authenticated";
    constexpr const char* ERR_SERVER_FULL = "server full";
    constexpr const char* ERR_AUTH_TIMEOUT = "authentication timeout";

    // ========== Messages ==========
    // One struct per wire type tag ("t"). Field names below are the C++ side;
    // wire names are in Protocol.cpp.

    struct Hello {
        std::string pin;
        bool operator==(const Hello& o) const { return pin == o.pin; }
    };

    struct Ok {
        std::string server;                    // optional on the wire
        std::vector<std::string> capabilities; // optional on the wire
        bool operator==(const Ok& o) const { return server == o.server && capabilities == o.capabilities; }
    };

    struct Error {
        std::string message;
        bool operator==(const Error& o) const { return message == o.message; }
    };

    struct Move {
        double dx = 0.0;
        double dy = 0.0;
        bool operator==(const Move& o) const { return dx == o.dx && dy == o.dy; }
    };

    struct Click {
        std::string button = "left";
        std::optional<bool> down; // nullopt: press and release
        bool operator==(const Click& o) const { return button == o.button && down == o.down; }
    };

    struct Key {
        std::string text;
        bool operator==(const Key& o) const { return text == o.text; }
    };

    struct Hotkey {
        std::vector<std::string> keys;
        bool operator==(const Hotkey& o) const { return keys == o.keys; }
    };

    struct Scroll {
        int dx = 0;
        int dy = 0; // positive scrolls up
        bool operator==(const Scroll& o) const { return dx == o.dx && dy == o.dy; }
    };

    struct Ping {
        bool operator==(const Ping&) const { return true; }
    };

    struct Pong {
        bool operator==(const Pong&) const { return true; }
    };

    using ControlMessage = std::variant<Hello, Ok, Error, Move, Click, Key, Hotkey, Scroll, Ping, Pong>;

    // ========== Codec ==========

    // Deterministic JSON text for one message
    std::string encode(const ControlMessage& message);

    // Parse one JSON text message. Malformed JSON, a missing or unknown "t",
    // a missing required field or a field of the wrong type is a ProtocolError.
    common::Result<ControlMessage> decode(const std::string& text);

    // Wire tag ("hello", "move", ...)
    const char* type_tag(const ControlMessage& message) noexcept;

    // Shorthand for the common reply
    inline std::string encode_error(const std::string& message) {
        return encode(Error{message});
    }

} // namespace protocol
} // namespace core
