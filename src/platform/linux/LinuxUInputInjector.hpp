#pragma once
#include "interfaces/IInputInjector.hpp"
#include <mutex>
#include <string>

namespace platform {
namespace linux_os {

    /**
     * Linux Input Injector using uinput (Kernel Virtual Device)
     *
     * Creates a virtual mouse + keyboard at the kernel level through
     * /dev/uinput. This works on BOTH X11 and Wayland because the OS sees it
     * as real hardware. Relative axes only, so no screen size is needed.
     *
     * REQUIREMENTS:
     *   - Read/Write access to /dev/uinput
     *   - Either: run as root, OR add user to 'input' group, OR set udev rules
     *
     * To enable without root (recommended):
     *   sudo usermod -aG input $USER
     *
     * Or create udev rule /etc/udev/rules.d/99-uinput.rules:
     *   KERNEL=="uinput", MODE="0660", GROUP="input"
     *
     * Text typing assumes a US keyboard layout.
     */
    class LinuxUInputInjector : public interfaces::IInputInjector {
    public:
        LinuxUInputInjector();
        ~LinuxUInputInjector() override;

        // IInputInjector interface
        common::EmptyResult move_relative(float dx, float dy) override;
        common::EmptyResult click(interfaces::MouseButton button, std::optional<bool> pressed) override;
        common::EmptyResult type_text(const std::string& text) override;
        common::EmptyResult press_combination(const std::vector<interfaces::KeyStroke>& keys) override;
        common::EmptyResult scroll(int dx, int dy) override;

        const char* name() const noexcept override { return "uinput"; }

        // Check if uinput is available
        bool is_available() const { return initialized_; }

        // Get error message if initialization failed
        std::string get_error() const { return error_message_; }

    private:
        int uinput_fd_;
        bool initialized_;
        std::string error_message_;
        float residual_x_ = 0.0f;
        float residual_y_ = 0.0f;
        std::mutex mutex_;

        // Helper functions
        bool setup_device();
        bool emit(int type, int code, int value);
        bool syn();
        bool tap_key(int code, bool shifted);
        common::EmptyResult not_ready() const;
    };

} // namespace linux_os
} // namespace platform
