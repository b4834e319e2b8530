#include "core/CommandDispatcher.hpp"

namespace core {
namespace command {

// ============================================================================
// Construction
// ============================================================================

CommandDispatcher::CommandDispatcher(std::shared_ptr<common::ILogger> logger)
    : logger_(logger ? std::move(logger) : common::make_null_logger()) {}

CommandDispatcher::~CommandDispatcher() = default;

// ============================================================================
// Handler Registration
// ============================================================================

void CommandDispatcher::register_handler(std::shared_ptr<ICommandHandler> handler) {
    handlers_.push_back(std::move(handler));
}

// ============================================================================
// Command Dispatching
// ============================================================================

common::EmptyResult CommandDispatcher::dispatch(
    const protocol::ControlMessage& message,
    const CommandContext& ctx
) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_dispatched++;
    }

    for (auto& handler : handlers_) {
        if (!handler->can_handle(message)) continue;

        auto parsed = handler->parse_command(message, ctx);
        if (parsed.is_err()) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.parse_errors++;
            return common::EmptyResult::err(parsed.error());
        }

        auto command = parsed.take();

        // Log non-high-frequency commands
        if (!command->is_high_frequency()) {
            logger_->debug("[CMD] " + std::string(command->type()) +
                           " [SID=" + std::to_string(ctx.session_id) + "]");
        }

        auto result = command->execute();
        if (result.is_err()) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.execution_errors++;
        }
        return result;
    }

    // No handler found
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.unknown_commands++;
    }

    std::string tag = protocol::type_tag(message);
    logger_->warn("[CMD] Unsupported: " + tag);
    return common::EmptyResult::err(common::ErrorCode::ProtocolError, "unsupported message type: " + tag);
}

// ============================================================================
// Statistics
// ============================================================================

CommandDispatcher::Stats CommandDispatcher::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace command
} // namespace core
