#pragma once
#include <vector>
#include <memory>
#include <mutex>
#include "common/Logger.hpp"
#include "core/ICommand.hpp"

namespace core {
namespace command {

// ============================================================================
// CommandDispatcher - Routes decoded messages to handlers
// ============================================================================
// Flat handler list with O(n) lookup (two handlers in practice).
//
// Thread Safety: dispatch() is thread-safe (handlers called without lock).
// Handlers are registered at startup only.
// ============================================================================

class CommandDispatcher {
public:
    explicit CommandDispatcher(std::shared_ptr<common::ILogger> logger);
    ~CommandDispatcher();

    // ========== Handler Registration ==========

    // Register a handler. Handlers are checked in registration order.
    void register_handler(std::shared_ptr<ICommandHandler> handler);

    // ========== Command Dispatching ==========

    // Build and execute the command for one message.
    //
    // Returns:
    //   - Ok: command executed
    //   - ProtocolError: no handler accepts this message type
    //   - TranslationError / injector error: from the handler or command
    common::EmptyResult dispatch(
        const protocol::ControlMessage& message,
        const CommandContext& ctx
    );

    // ========== Statistics ==========

    struct Stats {
        uint64_t total_dispatched = 0;
        uint64_t unknown_commands = 0;
        uint64_t parse_errors = 0;
        uint64_t execution_errors = 0;
    };

    Stats get_stats() const;

private:
    std::vector<std::shared_ptr<ICommandHandler>> handlers_;
    std::shared_ptr<common::ILogger> logger_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

} // namespace command
} // namespace core
