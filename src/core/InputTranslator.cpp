#include "core/InputTranslator.hpp"
#include "handlers/KeyboardCommandHandler.hpp"
#include "handlers/PointerCommandHandler.hpp"

namespace core {

InputTranslator::InputTranslator(std::shared_ptr<interfaces::IInputInjector> injector,
                                 interfaces::HostOs host_os,
                                 double pointer_scale,
                                 std::shared_ptr<common::ILogger> logger)
    : injector_(std::move(injector)),
      logger_(logger ? std::move(logger) : common::make_null_logger()),
      dispatcher_(logger_) {
    dispatcher_.register_handler(std::make_shared<handlers::PointerCommandHandler>(injector_, pointer_scale));
    dispatcher_.register_handler(std::make_shared<handlers::KeyboardCommandHandler>(injector_, KeyMap(host_os)));

    logger_->info(std::string("[Translator] Host OS ") + interfaces::to_string(host_os) +
                  ", injector " + (injector_ ? injector_->name() : "none") +
                  ", pointer scale " + std::to_string(pointer_scale));
}

common::EmptyResult InputTranslator::translate(const protocol::ControlMessage& message,
                                               const command::CommandContext& ctx) {
    return dispatcher_.dispatch(message, ctx);
}

void InputTranslator::release_buttons(const std::vector<interfaces::MouseButton>& buttons) {
    if (!injector_) return;
    for (auto button : buttons) {
        auto res = injector_->click(button, false);
        if (res.is_err()) {
            logger_->warn(std::string("[Translator] Failed to release ") + interfaces::to_string(button) +
                          " button: " + res.error().message);
        }
    }
}

} // namespace core
