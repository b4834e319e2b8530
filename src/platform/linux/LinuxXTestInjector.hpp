#pragma once
#include "interfaces/IInputInjector.hpp"
#include <mutex>

// Forward declarations to avoid including X11 headers in the header file
typedef struct _XDisplay Display;

namespace platform {
namespace linux_os {

    /**
     * Linux Input Injector using XTest Extension (X11)
     *
     * Injects pointer, wheel and key events into the X11 display server.
     * Works on most Linux desktops running Xorg.
     *
     * NOTE: This does NOT work on Wayland. For Wayland support, use
     * LinuxUInputInjector instead (requires root or uinput group membership).
     *
     * Dependencies:
     *   - libX11-dev / libX11-devel
     *   - libXtst-dev / libXtst-devel
     */
    class LinuxXTestInjector : public interfaces::IInputInjector {
    public:
        LinuxXTestInjector();
        ~LinuxXTestInjector() override;

        // IInputInjector interface
        common::EmptyResult move_relative(float dx, float dy) override;
        common::EmptyResult click(interfaces::MouseButton button, std::optional<bool> pressed) override;
        common::EmptyResult type_text(const std::string& text) override;
        common::EmptyResult press_combination(const std::vector<interfaces::KeyStroke>& keys) override;
        common::EmptyResult scroll(int dx, int dy) override;

        const char* name() const noexcept override { return "XTest"; }

        // Check if XTest is available
        bool is_available() const { return display_ != nullptr; }

    private:
        common::EmptyResult not_ready() const;
        unsigned long keysym_for(const interfaces::KeyStroke& key) const;
        bool send_key(unsigned long keysym, bool is_down);

        Display* display_;
        bool initialized_;
        float residual_x_ = 0.0f; // sub-pixel motion carried to the next move
        float residual_y_ = 0.0f;
        std::mutex mutex_;        // one display connection, one caller at a time
    };

} // namespace linux_os
} // namespace platform
