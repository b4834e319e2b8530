// ============================================================================
// Input translator tests
// ============================================================================
// Control messages against a recording injector: pointer scaling, click
// press/release semantics, key resolution per host OS and failure paths.
//
// Run with: ./InputTranslatorTest
// ============================================================================

#include <memory>
#include <string>
#include <vector>

#include "core/InputTranslator.hpp"
#include "core/KeyMap.hpp"
#include "testing/RecordingInputInjector.hpp"
#include "testing/TestReport.hpp"

using namespace core;
using namespace core::protocol;
using interfaces::HostOs;
using interfaces::KeyCode;
using testing::log_test;

namespace {

const command::CommandContext kContext{1, "10.0.0.2"};

using Calls = std::vector<std::string>;

struct Fixture {
    std::shared_ptr<testing::RecordingInputInjector> injector = std::make_shared<testing::RecordingInputInjector>();
    InputTranslator translator;

    explicit Fixture(HostOs os = HostOs::Linux, double scale = 1.0)
        : translator(injector, os, scale, common::make_null_logger()) {}

    common::EmptyResult run(const ControlMessage& message) { return translator.translate(message, kContext); }
};

std::string join(const Calls& calls) {
    std::string out;
    for (const auto& c : calls) out += "[" + c + "]";
    return out;
}

void test_pointer() {
    testing::section("Pointer");

    {
        Fixture f(HostOs::Linux, 1.5);
        auto rc = f.run(Move{10.0, -5.0});
        log_test("move is scaled", rc.is_ok() && f.injector->calls() == Calls{"move 15 -7.5"}, join(f.injector->calls()));
    }
    {
        Fixture f;
        f.run(Click{"left", std::nullopt});
        log_test("click without state is press and release", f.injector->calls() == Calls{"click left"});
    }
    {
        Fixture f;
        f.run(Click{"RIGHT", true});
        f.run(Click{"right", false});
        log_test("press only then release only", f.injector->calls() == Calls({"click right down", "click right up"}),
                 join(f.injector->calls()));
    }
    {
        Fixture f;
        f.run(Click{"left", true});
        f.run(Move{3.0, 4.0});
        f.run(Move{-1.0, 0.5});
        f.run(Click{"left", false});
        log_test("drag keeps message order",
                 f.injector->calls() == Calls({"click left down", "move 3 4", "move -1 0.5", "click left up"}),
                 join(f.injector->calls()));
    }
    {
        Fixture f;
        auto rc = f.run(Click{"thumb", std::nullopt});
        log_test("unknown button fails",
                 rc.is_err() && rc.error().code == common::ErrorCode::TranslationError &&
                 rc.error().message == "unknown button: thumb" && f.injector->calls().empty());
    }
    {
        Fixture f;
        f.run(Scroll{0, 3});
        f.run(Scroll{-2, 0});
        log_test("scroll ticks pass through", f.injector->calls() == Calls({"scroll 0 3", "scroll -2 0"}));
    }
}

void test_keyboard() {
    testing::section("Keyboard");

    {
        Fixture f;
        f.run(Key{"Hello, World"});
        log_test("text is typed verbatim", f.injector->calls() == Calls{"type Hello, World"});
    }
    {
        Fixture f;
        auto rc = f.run(Key{""});
        log_test("empty text is a no-op", rc.is_ok() && f.injector->calls().empty());
    }
    {
        Fixture f(HostOs::Linux);
        f.run(Hotkey{{"cmd", "C"}});
        log_test("cmd is Control on Linux", f.injector->calls() == Calls{"hotkey ctrl+c"}, join(f.injector->calls()));
    }
    {
        Fixture f(HostOs::Windows);
        f.run(Hotkey{{"ctrl", "alt", "Delete"}});
        log_test("ctrl+alt+delete on Windows", f.injector->calls() == Calls{"hotkey ctrl+alt+delete"},
                 join(f.injector->calls()));
    }
    {
        Fixture f(HostOs::MacOS);
        f.run(Hotkey{{"cmd", "shift", "t"}});
        f.run(Hotkey{{"ctrl", "v"}});
        log_test("cmd and ctrl are Command on macOS",
                 f.injector->calls() == Calls({"hotkey meta+shift+t", "hotkey meta+v"}), join(f.injector->calls()));
    }
    {
        Fixture f;
        auto rc = f.run(Hotkey{{"ctrl", "hyper"}});
        log_test("unknown key fails the whole combination",
                 rc.is_err() && rc.error().code == common::ErrorCode::TranslationError &&
                 rc.error().message == "unknown key: hyper" && f.injector->calls().empty());
    }
    {
        Fixture f;
        auto rc = f.run(Hotkey{{}});
        log_test("empty combination fails", rc.is_err() && f.injector->calls().empty());
    }
}

void test_key_map() {
    testing::section("Key map");

    KeyMap linux_keys(HostOs::Linux);
    KeyMap mac_keys(HostOs::MacOS);

    auto f5 = linux_keys.resolve("F5");
    log_test("function keys", f5.is_ok() && f5.unwrap().code == KeyCode::F5);
    auto win = linux_keys.resolve("win");
    auto super_key = linux_keys.resolve("super");
    log_test("win and super are Meta", win.is_ok() && super_key.is_ok() && win.unwrap().code == KeyCode::Meta &&
                                           super_key.unwrap().code == KeyCode::Meta);
    auto esc = linux_keys.resolve("Esc");
    log_test("names are case-insensitive", esc.is_ok() && esc.unwrap().code == KeyCode::Escape);
    auto space = linux_keys.resolve(" ");
    log_test("literal space", space.is_ok() && space.unwrap().code == KeyCode::Space);
    auto digit = linux_keys.resolve("7");
    log_test("single character", digit.is_ok() && digit.unwrap().code == KeyCode::Character &&
                                     digit.unwrap().character == '7');
    auto arrows = linux_keys.resolve_all({"up", "down", "left", "right"});
    log_test("arrows", arrows.is_ok() && arrows.unwrap().size() == 4 && arrows.unwrap()[3].code == KeyCode::Right);
    auto mac_cmd = mac_keys.resolve("CMD");
    log_test("cmd on macOS", mac_cmd.is_ok() && mac_cmd.unwrap().code == KeyCode::Meta);
    log_test("unknown name", linux_keys.resolve("f13").is_err() && linux_keys.resolve("").is_err());
}

void test_failures() {
    testing::section("Failures");

    {
        Fixture f;
        f.injector->fail_with("display gone");
        auto rc = f.run(Move{1.0, 1.0});
        log_test("injector failure is reported", rc.is_err() && rc.error().message == "display gone");
        log_test("execution error counted", f.translator.stats().execution_errors == 1);
    }
    {
        InputTranslator translator(nullptr, HostOs::Linux, 1.0, common::make_null_logger());
        auto rc = translator.translate(Key{"x"}, kContext);
        log_test("no injector is NotInitialized", rc.is_err() && rc.error().code == common::ErrorCode::NotInitialized);
    }
    {
        Fixture f;
        auto rc = f.run(Ping{});
        log_test("non-input message is unsupported",
                 rc.is_err() && rc.error().code == common::ErrorCode::ProtocolError &&
                 f.translator.stats().unknown_commands == 1);
    }
    {
        Fixture f;
        f.translator.release_buttons({interfaces::MouseButton::Left, interfaces::MouseButton::Middle});
        log_test("release_buttons releases each", f.injector->calls() == Calls({"click left up", "click middle up"}));
    }
}

} // namespace

int main() {
    std::cout << "Input Translator Test Suite" << std::endl;
    std::cout << "===========================" << std::endl;

    test_pointer();
    test_keyboard();
    test_key_map();
    test_failures();

    return testing::print_summary("INPUT TRANSLATOR");
}
