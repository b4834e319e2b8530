// ============================================================================
// Session manager tests
// ============================================================================
// Authentication, connection cap, message routing, error replies and
// per-session isolation, all over in-memory connections.
//
// Run with: ./SessionManagerTest
// ============================================================================

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/SessionManager.hpp"
#include "testing/FakeConnection.hpp"
#include "testing/RecordingInputInjector.hpp"
#include "testing/TestReport.hpp"

using namespace core;
using namespace core::protocol;
using testing::FakeConnection;
using testing::log_test;

namespace {

struct Fixture {
    std::shared_ptr<testing::RecordingInputInjector> injector = std::make_shared<testing::RecordingInputInjector>();
    std::shared_ptr<SessionManager> sessions;

    explicit Fixture(std::string pin = "123456", size_t max_sessions = 10) {
        SessionSettings settings;
        settings.server_name = "Test Host";
        settings.pin = std::move(pin);
        settings.max_sessions = max_sessions;
        settings.capabilities = {"mouse", "keyboard"};
        auto translator = std::make_shared<InputTranslator>(injector, interfaces::HostOs::Linux, 1.0,
                                                            common::make_null_logger());
        sessions = std::make_shared<SessionManager>(settings, translator, common::make_null_logger());
    }

    // Accept a fresh connection; 0 when refused
    SessionId open(const std::shared_ptr<FakeConnection>& connection) {
        auto id = sessions->accept(connection);
        return id.is_ok() ? id.unwrap() : 0;
    }

    SessionId open_authenticated(const std::shared_ptr<FakeConnection>& connection) {
        SessionId id = open(connection);
        sessions->on_message(id, encode(Hello{"123456"}));
        return id;
    }
};

bool last_reply_is(const FakeConnection& connection, const ControlMessage& expected) {
    auto decoded = decode(connection.last_sent());
    return decoded.is_ok() && decoded.unwrap() == expected;
}

void test_authentication() {
    testing::section("Authentication");

    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open(conn);
        log_test("accepted session starts unauthenticated", id != 0 && !f.sessions->is_authenticated(id));

        auto disposition = f.sessions->on_message(id, encode(Hello{"123456"}));
        log_test("correct pin authenticates", disposition == Disposition::Continue && f.sessions->is_authenticated(id));
        log_test("ok carries server name and capabilities",
                 last_reply_is(*conn, Ok{"Test Host", {"mouse", "keyboard"}}), conn->last_sent());
    }
    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open(conn);
        auto disposition = f.sessions->on_message(id, encode(Hello{"000000"}));
        log_test("wrong pin replies invalid pin", last_reply_is(*conn, Error{"invalid pin"}));
        log_test("wrong pin closes the connection", disposition == Disposition::Close && conn->closed());
    }
    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open(conn);
        f.sessions->on_message(id, encode(Hello{"1234567"}));
        log_test("longer pin with matching prefix is rejected", !f.sessions->is_authenticated(id) && conn->closed());
    }
    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open(conn);
        f.sessions->on_message(id, encode(Hello{"12345"}));
        log_test("shorter pin is rejected", !f.sessions->is_authenticated(id));
    }
    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open(conn);
        auto disposition = f.sessions->on_message(id, encode(Move{5.0, 5.0}));
        log_test("command before hello is refused",
                 disposition == Disposition::Continue && last_reply_is(*conn, Error{"authentication required"}));
        log_test("session stays open and unauthenticated",
                 !conn->closed() && !f.sessions->is_authenticated(id) && f.injector->calls().empty());

        f.sessions->on_message(id, encode(Hello{"123456"}));
        log_test("hello still accepted afterwards", f.sessions->is_authenticated(id));
    }
    {
        Fixture f("");
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open(conn);
        f.sessions->on_message(id, encode(Hello{"anything"}));
        log_test("empty configured pin accepts any hello", f.sessions->is_authenticated(id));
    }
    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open_authenticated(conn);
        f.sessions->on_message(id, encode(Hello{"123456"}));
        log_test("second hello is an error", last_reply_is(*conn, Error{"already authenticated"}) &&
                                                 f.sessions->is_authenticated(id));
    }
}

void test_capacity() {
    testing::section("Capacity");

    Fixture f("123456", 2);
    auto a = std::make_shared<FakeConnection>("10.0.0.2");
    auto b = std::make_shared<FakeConnection>("10.0.0.3");
    auto c = std::make_shared<FakeConnection>("10.0.0.4");

    SessionId id_a = f.open(a);
    SessionId id_b = f.open(b);
    auto refused = f.sessions->accept(c);

    log_test("sessions up to the cap are accepted", id_a != 0 && id_b != 0 && f.sessions->session_count() == 2);
    log_test("connection past the cap is refused",
             refused.is_err() && refused.error().code == common::ErrorCode::CapacityError);
    log_test("refused connection is told and closed", last_reply_is(*c, Error{"server full"}) && c->closed());
    log_test("existing sessions unaffected", !a->closed() && !b->closed());

    f.sessions->on_disconnect(id_a);
    auto d = std::make_shared<FakeConnection>("10.0.0.5");
    log_test("a freed slot can be reused", f.open(d) != 0 && f.sessions->session_count() == 2);
}

void test_routing() {
    testing::section("Routing");

    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open_authenticated(conn);
        size_t replies = conn->sent().size();

        f.sessions->on_message(id, encode(Click{"left", true}));
        f.sessions->on_message(id, encode(Move{2.0, 3.0}));
        f.sessions->on_message(id, encode(Click{"left", false}));
        f.sessions->on_message(id, encode(Hotkey{{"ctrl", "z"}}));
        f.sessions->on_message(id, encode(Scroll{0, -1}));
        f.sessions->on_message(id, encode(Key{"ok"}));

        std::vector<std::string> expected = {"click left down", "move 2 3", "click left up",
                                             "hotkey ctrl+z", "scroll 0 -1", "type ok"};
        log_test("input reaches the injector in order", f.injector->calls() == expected);
        log_test("successful input sends no reply", conn->sent().size() == replies);
    }
    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open_authenticated(conn);
        f.sessions->on_message(id, encode(Ping{}));
        log_test("ping is answered with pong", last_reply_is(*conn, Pong{}));
    }
    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open_authenticated(conn);

        auto disposition = f.sessions->on_message(id, std::string("{broken"));
        log_test("malformed json is answered and survived",
                 disposition == Disposition::Continue && last_reply_is(*conn, Error{"invalid json"}) && !conn->closed());

        f.sessions->on_message(id, std::string(R"({"t":"warp"})"));
        log_test("unknown type is answered", last_reply_is(*conn, Error{"unknown message type: warp"}));

        f.sessions->on_message(id, encode(Hotkey{{"ctrl", "nope"}}));
        log_test("translation failure is answered", last_reply_is(*conn, Error{"unknown key: nope"}));

        f.sessions->on_message(id, encode(Move{1.0, 0.0}));
        log_test("session keeps working after errors",
                 f.sessions->is_authenticated(id) && f.injector->calls() == std::vector<std::string>{"move 1 0"});
    }
    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open(conn);
        f.sessions->on_message(id, std::string("garbage"));
        log_test("malformed message before hello keeps the session",
                 !conn->closed() && f.sessions->find(id).has_value());
    }
    {
        Fixture f;
        log_test("unknown session id closes", f.sessions->on_message(999, encode(Ping{})) == Disposition::Close);
    }
}

void test_lifecycle() {
    testing::section("Lifecycle");

    {
        Fixture f;
        auto a = std::make_shared<FakeConnection>("10.0.0.2");
        auto b = std::make_shared<FakeConnection>("10.0.0.3");
        SessionId id_a = f.open_authenticated(a);
        SessionId id_b = f.open_authenticated(b);

        f.sessions->on_disconnect(id_a);
        log_test("disconnect removes only that session",
                 !f.sessions->find(id_a).has_value() && f.sessions->is_authenticated(id_b));
        f.sessions->on_disconnect(id_a);
        log_test("second disconnect is harmless", f.sessions->session_count() == 1);
    }
    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open_authenticated(conn);
        f.sessions->on_message(id, encode(Click{"left", true}));
        f.sessions->on_message(id, encode(Click{"right", true}));
        f.sessions->on_message(id, encode(Click{"right", false}));
        f.injector->clear();

        f.sessions->on_disconnect(id);
        log_test("held buttons released when session ends",
                 f.injector->calls() == std::vector<std::string>{"click left up"});
    }
    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>();
        SessionId id = f.open(conn);
        log_test("unauthenticated session expires", f.sessions->expire_unauthenticated(id));
        log_test("expiry is reported and closes",
                 last_reply_is(*conn, Error{"authentication timeout"}) && conn->closed());

        auto other = std::make_shared<FakeConnection>();
        SessionId other_id = f.open_authenticated(other);
        log_test("authenticated session does not expire",
                 !f.sessions->expire_unauthenticated(other_id) && !other->closed());
    }
    {
        Fixture f;
        auto a = std::make_shared<FakeConnection>();
        auto b = std::make_shared<FakeConnection>();
        f.open(a);
        f.open_authenticated(b);
        f.sessions->close_all();
        log_test("close_all closes every connection", a->closed() && b->closed());
    }
    {
        Fixture f;
        auto conn = std::make_shared<FakeConnection>("192.168.7.7");
        SessionId id = f.open(conn);
        auto info = f.sessions->find(id);
        log_test("session info", info.has_value() && info->remote_address == "192.168.7.7" &&
                                     info->state == AuthState::Unauthenticated);
    }
}

void test_concurrency() {
    testing::section("Concurrency");

    Fixture f("123456", 64);
    std::vector<std::shared_ptr<FakeConnection>> connections;
    std::vector<SessionId> ids;
    for (int i = 0; i < 8; ++i) {
        connections.push_back(std::make_shared<FakeConnection>("10.0.1." + std::to_string(i)));
        ids.push_back(f.open_authenticated(connections.back()));
    }

    std::vector<std::thread> threads;
    for (size_t i = 0; i < ids.size(); ++i) {
        threads.emplace_back([&f, id = ids[i]]() {
            for (int n = 0; n < 50; ++n) {
                f.sessions->on_message(id, encode(Move{1.0, 1.0}));
            }
        });
    }
    for (auto& t : threads) t.join();

    log_test("all moves from concurrent sessions delivered", f.injector->calls().size() == ids.size() * 50);

    std::atomic<int> accepted{0};
    std::vector<std::thread> churn;
    for (int i = 0; i < 8; ++i) {
        churn.emplace_back([&f, &accepted]() {
            for (int n = 0; n < 20; ++n) {
                auto id = f.sessions->accept(std::make_shared<FakeConnection>());
                if (id.is_ok()) {
                    accepted++;
                    f.sessions->on_disconnect(id.unwrap());
                }
            }
        });
    }
    for (auto& t : churn) t.join();
    log_test("concurrent accept/disconnect keeps the registry consistent",
             accepted == 160 && f.sessions->session_count() == ids.size());
}

} // namespace

int main() {
    std::cout << "Session Manager Test Suite" << std::endl;
    std::cout << "==========================" << std::endl;

    test_authentication();
    test_capacity();
    test_routing();
    test_lifecycle();
    test_concurrency();

    return testing::print_summary("SESSION MANAGER");
}
