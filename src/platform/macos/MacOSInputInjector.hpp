#pragma once
#include "interfaces/IInputInjector.hpp"
#include <mutex>

namespace platform {
namespace macos {

/**
 * macOS Input Injector using Quartz Event Services (CGEvent)
 *
 * Requires the Accessibility permission for the host process
 * (System Settings > Privacy & Security > Accessibility). Without it
 * events are silently dropped by the window server.
 */
class MacOSInputInjector : public interfaces::IInputInjector {
public:
    MacOSInputInjector() = default;
    ~MacOSInputInjector() override = default;

    common::EmptyResult move_relative(float dx, float dy) override;
    common::EmptyResult click(interfaces::MouseButton button, std::optional<bool> pressed) override;
    common::EmptyResult type_text(const std::string& text) override;
    common::EmptyResult press_combination(const std::vector<interfaces::KeyStroke>& keys) override;
    common::EmptyResult scroll(int dx, int dy) override;

    const char* name() const noexcept override { return "Quartz"; }

    // True when the process is trusted for Accessibility
    static bool has_accessibility_permission();

private:
    std::mutex mutex_;
};

} // namespace macos
} // namespace platform
