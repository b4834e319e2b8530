#pragma once
#include "interfaces/IInputInjector.hpp"
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace testing {

    // Records every call as a readable line, e.g. "move 15 -7.5",
    // "click left down", "hotkey Ctrl+c". Can be told to fail.
    class RecordingInputInjector : public interfaces::IInputInjector {
    public:
        common::EmptyResult move_relative(float dx, float dy) override {
            std::ostringstream line;
            line << "move " << dx << " " << dy;
            return record(line.str());
        }

        common::EmptyResult click(interfaces::MouseButton button, std::optional<bool> pressed) override {
            std::string line = std::string("click ") + interfaces::to_string(button);
            if (pressed.has_value()) line += *pressed ? " down" : " up";
            return record(line);
        }

        common::EmptyResult type_text(const std::string& text) override {
            return record("type " + text);
        }

        common::EmptyResult press_combination(const std::vector<interfaces::KeyStroke>& keys) override {
            std::string line = "hotkey ";
            for (size_t i = 0; i < keys.size(); ++i) {
                if (i > 0) line += "+";
                line += interfaces::to_string(keys[i]);
            }
            return record(line);
        }

        common::EmptyResult scroll(int dx, int dy) override {
            return record("scroll " + std::to_string(dx) + " " + std::to_string(dy));
        }

        const char* name() const noexcept override { return "Recording"; }

        std::vector<std::string> calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return calls_;
        }

        void clear() {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.clear();
        }

        // Subsequent calls are recorded and then fail with SystemError
        void fail_with(const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            failure_ = message;
        }

    private:
        common::EmptyResult record(const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(line);
            if (!failure_.empty()) {
                return common::EmptyResult::err(common::ErrorCode::SystemError, failure_);
            }
            return common::EmptyResult::success();
        }

        mutable std::mutex mutex_;
        std::vector<std::string> calls_;
        std::string failure_;
    };

} // namespace testing
