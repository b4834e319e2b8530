#pragma once
#include <string>
#include "common/Result.hpp"

namespace interfaces {

    /**
     * Host side of one client connection, as seen by core::SessionManager.
     * The transport (WebSocket over TCP in production, an in-memory fake in
     * tests) owns framing; this is only "send one text message" and "hang up".
     */
    class IConnection {
    public:
        virtual ~IConnection() = default;

        // Send one complete text message. Safe to call from any thread.
        virtual common::EmptyResult send_text(const std::string& text) = 0;

        // Close the transport. Idempotent.
        virtual void close() = 0;

        virtual std::string remote_address() const = 0;
    };

}
