#include "handlers/PointerCommandHandler.hpp"
#include "core/KeyMap.hpp"

namespace handlers {

using core::command::ICommand;
using CommandResult = common::Result<std::unique_ptr<ICommand>>;

bool PointerCommandHandler::can_handle(const core::protocol::ControlMessage& message) const {
    return std::holds_alternative<core::protocol::Move>(message) ||
           std::holds_alternative<core::protocol::Click>(message) ||
           std::holds_alternative<core::protocol::Scroll>(message);
}

CommandResult PointerCommandHandler::parse_command(
    const core::protocol::ControlMessage& message,
    const core::command::CommandContext& /*ctx*/
) {
    if (auto* move = std::get_if<core::protocol::Move>(&message)) {
        float dx = static_cast<float>(move->dx * pointer_scale_);
        float dy = static_cast<float>(move->dy * pointer_scale_);
        return CommandResult(std::make_unique<PointerMoveCommand>(injector_, dx, dy));
    }

    if (auto* click = std::get_if<core::protocol::Click>(&message)) {
        auto button = core::parse_mouse_button(click->button);
        if (button.is_err()) return CommandResult::err(button.error());
        return CommandResult(std::make_unique<PointerClickCommand>(injector_, button.unwrap(), click->down));
    }

    if (auto* scroll = std::get_if<core::protocol::Scroll>(&message)) {
        return CommandResult(std::make_unique<ScrollCommand>(injector_, scroll->dx, scroll->dy));
    }

    return CommandResult::err(common::ErrorCode::ProtocolError,
                              std::string("not a pointer message: ") + core::protocol::type_tag(message));
}

} // namespace handlers
