#include "handlers/KeyboardCommandHandler.hpp"

namespace handlers {

using core::command::ICommand;
using CommandResult = common::Result<std::unique_ptr<ICommand>>;

bool KeyboardCommandHandler::can_handle(const core::protocol::ControlMessage& message) const {
    return std::holds_alternative<core::protocol::Key>(message) ||
           std::holds_alternative<core::protocol::Hotkey>(message);
}

CommandResult KeyboardCommandHandler::parse_command(
    const core::protocol::ControlMessage& message,
    const core::command::CommandContext& /*ctx*/
) {
    if (auto* key = std::get_if<core::protocol::Key>(&message)) {
        return CommandResult(std::make_unique<TypeTextCommand>(injector_, key->text));
    }

    if (auto* hotkey = std::get_if<core::protocol::Hotkey>(&message)) {
        if (hotkey->keys.empty()) {
            return CommandResult::err(common::ErrorCode::TranslationError, "empty key combination");
        }
        auto keys = key_map_.resolve_all(hotkey->keys);
        if (keys.is_err()) return CommandResult::err(keys.error());
        return CommandResult(std::make_unique<HotkeyCommand>(injector_, keys.take()));
    }

    return CommandResult::err(common::ErrorCode::ProtocolError,
                              std::string("not a keyboard message: ") + core::protocol::type_tag(message));
}

} // namespace handlers
