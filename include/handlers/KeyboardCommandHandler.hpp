#pragma once
#include "core/ICommand.hpp"
#include "core/KeyMap.hpp"
#include "interfaces/IInputInjector.hpp"
#include <memory>
#include <vector>

namespace handlers {

// ============================================================================
// KeyboardCommandHandler - Handles keyboard messages
// ============================================================================
// Messages: key (text typing), hotkey (key combination)
// Hotkey names are resolved through KeyMap when the command is built, so an
// unknown name fails the message before any key goes down.
// ============================================================================

class KeyboardCommandHandler final : public core::command::ICommandHandler {
public:
    KeyboardCommandHandler(std::shared_ptr<interfaces::IInputInjector> injector, core::KeyMap key_map)
        : injector_(std::move(injector)), key_map_(key_map) {}

    bool can_handle(const core::protocol::ControlMessage& message) const override;

    const char* category() const noexcept override { return "Keyboard"; }

    common::Result<std::unique_ptr<core::command::ICommand>> parse_command(
        const core::protocol::ControlMessage& message,
        const core::command::CommandContext& ctx
    ) override;

private:
    std::shared_ptr<interfaces::IInputInjector> injector_;
    core::KeyMap key_map_;
};

class TypeTextCommand final : public core::command::ICommand {
public:
    TypeTextCommand(std::shared_ptr<interfaces::IInputInjector> injector, std::string text)
        : injector_(std::move(injector)), text_(std::move(text)) {}

    common::EmptyResult execute() override {
        if (!injector_) {
            return common::EmptyResult::err(common::ErrorCode::NotInitialized, "No input injector");
        }
        if (text_.empty()) return common::EmptyResult::success();
        return injector_->type_text(text_);
    }

    const char* type() const noexcept override { return "key"; }

private:
    std::shared_ptr<interfaces::IInputInjector> injector_;
    std::string text_;
};

class HotkeyCommand final : public core::command::ICommand {
public:
    HotkeyCommand(std::shared_ptr<interfaces::IInputInjector> injector,
                  std::vector<interfaces::KeyStroke> keys)
        : injector_(std::move(injector)), keys_(std::move(keys)) {}

    common::EmptyResult execute() override {
        if (!injector_) {
            return common::EmptyResult::err(common::ErrorCode::NotInitialized, "No input injector");
        }
        return injector_->press_combination(keys_);
    }

    const char* type() const noexcept override { return "hotkey"; }

private:
    std::shared_ptr<interfaces::IInputInjector> injector_;
    std::vector<interfaces::KeyStroke> keys_;
};

} // namespace handlers
