#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include "common/Result.hpp"
#include "core/Protocol.hpp"

namespace core {
namespace command {

// ============================================================================
// CommandContext - Who a command is being executed for
// ============================================================================
// Passed by reference to handlers. Replies go back through the session, so
// the context only carries identity for logging.
// ============================================================================

struct CommandContext {
    uint64_t session_id = 0;
    std::string remote_address;
};

// ============================================================================
// ICommand - Base interface for all commands (Command Pattern)
// ============================================================================
// Each command encapsulates a single input action. Commands are:
// - Immutable after creation
// - Self-contained (has all data needed for execution)
//
// Commands are created per message, not reused.
// ============================================================================

class ICommand {
public:
    virtual ~ICommand() = default;

    // Execute the command
    // Returns:
    //   - Ok: input was injected
    //   - Error: the OS binding refused or is unavailable
    virtual common::EmptyResult execute() = 0;

    // Command type identifier (for logging/debugging)
    virtual const char* type() const noexcept = 0;

    // Is this a high-frequency command? (affects logging)
    // Pointer move commands are not logged to reduce noise
    virtual bool is_high_frequency() const noexcept { return false; }
};

// ============================================================================
// ICommandHandler - Factory for creating commands (Strategy Pattern)
// ============================================================================
// Handlers are registered with CommandDispatcher. Each handler is responsible
// for a category of messages (pointer, keyboard).
// ============================================================================

class ICommandHandler {
public:
    virtual ~ICommandHandler() = default;

    // Check if this handler can process the given message
    virtual bool can_handle(const protocol::ControlMessage& message) const = 0;

    // Create a command object for the given message.
    // Returns a TranslationError when a button or key name is unknown.
    virtual common::Result<std::unique_ptr<ICommand>> parse_command(
        const protocol::ControlMessage& message,
        const CommandContext& ctx
    ) = 0;

    // Handler category name (for logging/debugging)
    virtual const char* category() const noexcept = 0;
};

} // namespace command
} // namespace core
