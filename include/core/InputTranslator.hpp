#pragma once
#include <memory>
#include <vector>
#include "common/Logger.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/KeyMap.hpp"
#include "interfaces/IInputInjector.hpp"

namespace core {

/**
 * @brief Turns authenticated control messages into OS input.
 *
 * Owns a CommandDispatcher with the pointer and keyboard handlers registered
 * against one IInputInjector. The injector may be null when no OS binding is
 * usable; every input message then fails with NotInitialized.
 */
class InputTranslator {
public:
    InputTranslator(std::shared_ptr<interfaces::IInputInjector> injector,
                    interfaces::HostOs host_os,
                    double pointer_scale,
                    std::shared_ptr<common::ILogger> logger);

    common::EmptyResult translate(const protocol::ControlMessage& message,
                                  const command::CommandContext& ctx);

    // Release buttons a closing session left pressed
    void release_buttons(const std::vector<interfaces::MouseButton>& buttons);

    command::CommandDispatcher::Stats stats() const { return dispatcher_.get_stats(); }

private:
    std::shared_ptr<interfaces::IInputInjector> injector_;
    std::shared_ptr<common::ILogger> logger_;
    command::CommandDispatcher dispatcher_;
};

} // namespace core
