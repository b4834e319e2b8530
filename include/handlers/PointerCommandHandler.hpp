#pragma once
#include "core/ICommand.hpp"
#include "interfaces/IInputInjector.hpp"
#include <memory>
#include <optional>

namespace handlers {

// ============================================================================
// PointerCommandHandler - Handles pointer messages
// ============================================================================
// Messages: move, click, scroll
//
// Relative motion is multiplied by the pointer scale before injection.
// Move commands are marked high_frequency to skip logging.
// ============================================================================

class PointerCommandHandler final : public core::command::ICommandHandler {
public:
    PointerCommandHandler(std::shared_ptr<interfaces::IInputInjector> injector, double pointer_scale)
        : injector_(std::move(injector)), pointer_scale_(pointer_scale) {}

    bool can_handle(const core::protocol::ControlMessage& message) const override;

    const char* category() const noexcept override { return "Pointer"; }

    common::Result<std::unique_ptr<core::command::ICommand>> parse_command(
        const core::protocol::ControlMessage& message,
        const core::command::CommandContext& ctx
    ) override;

private:
    std::shared_ptr<interfaces::IInputInjector> injector_;
    double pointer_scale_;
};

// ============================================================================
// Concrete Pointer Commands
// ============================================================================

class PointerMoveCommand final : public core::command::ICommand {
public:
    PointerMoveCommand(std::shared_ptr<interfaces::IInputInjector> injector, float dx, float dy)
        : injector_(std::move(injector)), dx_(dx), dy_(dy) {}

    common::EmptyResult execute() override {
        if (!injector_) {
            return common::EmptyResult::err(common::ErrorCode::NotInitialized, "No input injector");
        }
        return injector_->move_relative(dx_, dy_);
    }

    const char* type() const noexcept override { return "move"; }
    bool is_high_frequency() const noexcept override { return true; }

private:
    std::shared_ptr<interfaces::IInputInjector> injector_;
    float dx_, dy_;
};

class PointerClickCommand final : public core::command::ICommand {
public:
    PointerClickCommand(
        std::shared_ptr<interfaces::IInputInjector> injector,
        interfaces::MouseButton button,
        std::optional<bool> pressed
    ) : injector_(std::move(injector)), button_(button), pressed_(pressed) {}

    common::EmptyResult execute() override {
        if (!injector_) {
            return common::EmptyResult::err(common::ErrorCode::NotInitialized, "No input injector");
        }
        return injector_->click(button_, pressed_);
    }

    const char* type() const noexcept override {
        if (!pressed_.has_value()) return "click";
        return *pressed_ ? "button_down" : "button_up";
    }

private:
    std::shared_ptr<interfaces::IInputInjector> injector_;
    interfaces::MouseButton button_;
    std::optional<bool> pressed_;
};

class ScrollCommand final : public core::command::ICommand {
public:
    ScrollCommand(std::shared_ptr<interfaces::IInputInjector> injector, int dx, int dy)
        : injector_(std::move(injector)), dx_(dx), dy_(dy) {}

    common::EmptyResult execute() override {
        if (!injector_) {
            return common::EmptyResult::err(common::ErrorCode::NotInitialized, "No input injector");
        }
        return injector_->scroll(dx_, dy_);
    }

    const char* type() const noexcept override { return "scroll"; }

private:
    std::shared_ptr<interfaces::IInputInjector> injector_;
    int dx_, dy_;
};

} // namespace handlers
