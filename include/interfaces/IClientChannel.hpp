#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "common/Result.hpp"

namespace interfaces {

    // Callbacks fire on the channel's own IO thread. on_closed fires exactly
    // once per open(), whether the connect failed or an open channel dropped.
    struct ChannelHandlers {
        std::function<void()> on_open;
        std::function<void(const std::string& text)> on_message;
        std::function<void(const std::string& reason)> on_closed;
    };

    /**
     * Client side persistent bidirectional text channel to a host.
     * One instance per connection attempt.
     */
    class IClientChannel {
    public:
        virtual ~IClientChannel() = default;

        // Start connecting in the background. Returns immediately.
        virtual void open(const std::string& host, uint16_t port, ChannelHandlers handlers) = 0;

        virtual common::EmptyResult send_text(const std::string& text) = 0;

        // Cancel a pending connect or close an open channel. Idempotent.
        // Callbacks may still be in flight when this returns.
        virtual void close() = 0;
    };

    using ChannelFactory = std::function<std::unique_ptr<IClientChannel>()>;

}
