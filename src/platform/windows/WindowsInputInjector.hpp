#pragma once
#include "interfaces/IInputInjector.hpp"
#include <windows.h>
#include <mutex>

namespace platform {
namespace windows_os {

    // SendInput based injector. Text is typed as Unicode key events so it is
    // independent of the active keyboard layout.
    class WindowsInputInjector : public interfaces::IInputInjector {
    public:
        common::EmptyResult move_relative(float dx, float dy) override;
        common::EmptyResult click(interfaces::MouseButton button, std::optional<bool> pressed) override;
        common::EmptyResult type_text(const std::string& text) override;
        common::EmptyResult press_combination(const std::vector<interfaces::KeyStroke>& keys) override;
        common::EmptyResult scroll(int dx, int dy) override;

        const char* name() const noexcept override { return "SendInput"; }

    private:
        common::EmptyResult send(std::vector<INPUT>& inputs);

        float residual_x_ = 0.0f;
        float residual_y_ = 0.0f;
        std::mutex mutex_;
    };

}
}
