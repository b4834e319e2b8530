// ============================================================================
// Remote control client tests
// ============================================================================
// The UI-facing facade over scripted channels and an in-memory store:
// discovered host list updates, saved host persistence, manual hosts and
// remembering the host of an active connection.
//
// Run with: ./RemoteControlClientTest
// ============================================================================

#include <memory>
#include <string>
#include <vector>

#include "client/HostDirectory.hpp"
#include "client/RemoteControlClient.hpp"
#include "core/HostRecord.hpp"
#include "core/Protocol.hpp"
#include "testing/FakeClientChannel.hpp"
#include "testing/InMemorySettingsStore.hpp"
#include "testing/ManualExecutor.hpp"
#include "testing/TestReport.hpp"

using namespace std::chrono_literals;
using namespace core::protocol;
using client::ConnectionState;
using core::HostRecord;
using testing::log_test;

namespace {

HostRecord host(const std::string& name, const std::string& address) {
    HostRecord h;
    h.name = name;
    h.address = address;
    h.advertised_ip = address;
    h.pin_required = true;
    h.capabilities = {"mouse", "keyboard"};
    return h;
}

std::vector<std::string> addresses(const std::vector<HostRecord>& hosts) {
    std::vector<std::string> out;
    for (const auto& h : hosts) out.push_back(h.address);
    return out;
}

struct Fixture {
    testing::ManualExecutor executor;
    testing::FakeChannelHub hub;
    std::shared_ptr<testing::InMemorySettingsStore> store = std::make_shared<testing::InMemorySettingsStore>();
    std::unique_ptr<client::RemoteControlClient> client;

    void start() {
        client = std::make_unique<client::RemoteControlClient>(executor, hub.factory(), store,
                                                               common::make_null_logger());
    }

    // Saved list as the store holds it
    std::vector<HostRecord> stored() const {
        auto text = store->get(client::HostDirectory::SETTINGS_KEY);
        if (!text) return {};
        auto parsed = core::deserialize_host_list(*text);
        return parsed.is_ok() ? parsed.unwrap() : std::vector<HostRecord>{};
    }
};

void test_discovery_results() {
    testing::section("Discovery results");

    {
        Fixture f;
        f.store->set(client::HostDirectory::SETTINGS_KEY,
                     core::serialize_host_list({host("Saved", "10.0.0.5")}));
        f.start();
        log_test("saved hosts are listed before any scan",
                 addresses(f.client->discovered_hosts()) == std::vector<std::string>{"10.0.0.5"});
    }

    {
        Fixture f;
        f.start();

        int notified = 0;
        std::vector<HostRecord> last_notified;
        f.client->subscribe_hosts([&](const std::vector<HostRecord>& hosts) {
            ++notified;
            last_notified = hosts;
        });

        f.client->on_hosts_found({host("Office", "192.168.1.10"), host("Den", "192.168.1.11")});
        log_test("found hosts become the discovered list",
                 addresses(f.client->discovered_hosts()) ==
                     std::vector<std::string>({"192.168.1.10", "192.168.1.11"}));
        log_test("found hosts are saved",
                 addresses(f.stored()) == std::vector<std::string>({"192.168.1.10", "192.168.1.11"}));
        log_test("observer is told about the new list", notified == 1 && last_notified.size() == 2);

        f.client->on_hosts_found({});
        log_test("an empty window keeps the previous list",
                 f.client->discovered_hosts().size() == 2 && notified == 1);

        f.client->on_hosts_found({host("Office renamed", "192.168.1.10")});
        auto discovered = f.client->discovered_hosts();
        log_test("a later window replaces the list",
                 discovered.size() == 1 && discovered[0].name == "Office renamed");

        auto saved = f.stored();
        bool updated_once = saved.size() == 2 && saved.back().address == "192.168.1.10" &&
                            saved.back().name == "Office renamed";
        log_test("saved list keeps one entry per address", updated_once);
    }
}

void test_manual_hosts() {
    testing::section("Manual hosts");

    Fixture f;
    f.start();

    auto added = f.client->add_manual_host("10.1.2.3:9000", "Lab");
    log_test("manual host is parsed",
             added.is_ok() && added.unwrap().address == "10.1.2.3" && added.unwrap().port == 9000 &&
             added.unwrap().name == "Lab");
    log_test("manual host is saved",
             addresses(f.client->saved_hosts()) == std::vector<std::string>{"10.1.2.3"} &&
             addresses(f.stored()) == std::vector<std::string>{"10.1.2.3"});

    auto bad = f.client->add_manual_host("10.1.2.3:notaport");
    log_test("bad endpoint is rejected", bad.is_err() && f.stored().size() == 1);

    log_test("forget removes a saved host", f.client->forget_host("10.1.2.3") && f.stored().empty());
    log_test("forgetting an unknown host reports false", !f.client->forget_host("10.9.9.9"));
}

void test_active_host_remembered() {
    testing::section("Active host");

    Fixture f;
    f.start();

    int active_updates = 0;
    f.client->subscribe_status([&](const client::ConnectionStatus& s) {
        if (s.state == ConnectionState::Active) ++active_updates;
    });

    HostRecord typed;
    typed.address = "172.16.0.4";
    f.client->connect(typed, "4321");
    f.executor.run_pending();
    log_test("connecting does not save the host yet",
             f.stored().empty() && f.client->connection_status().state == ConnectionState::Connecting);

    f.hub.latest()->fire_open();
    f.executor.run_pending();
    f.executor.advance(100ms);
    f.hub.latest()->fire_message(encode(Ok{"Studio", {"mouse"}}));
    f.executor.run_pending();

    auto saved = f.stored();
    log_test("active connection saves the host with its server name",
             f.client->connection_status().state == ConnectionState::Active && saved.size() == 1 &&
             saved[0].address == "172.16.0.4" && saved[0].name == "Studio");
    log_test("status observers see the active state", active_updates == 1);

    int writes = f.store->writes();
    f.client->send_move(1.0, 2.0);
    f.executor.run_pending();
    log_test("input goes out on the channel",
             !f.hub.latest()->sent.empty() && f.hub.latest()->sent.back() == encode(Move{1.0, 2.0}));
    log_test("staying active does not rewrite the saved list", f.store->writes() == writes);

    f.client->disconnect();
    f.executor.run_pending();
    log_test("disconnect keeps the saved host",
             f.client->connection_status().state == ConnectionState::Idle && f.stored().size() == 1);
}

} // namespace

int main() {
    std::cout << "Remote Control Client Test Suite" << std::endl;
    std::cout << "================================" << std::endl;

    test_discovery_results();
    test_manual_hosts();
    test_active_host_remembered();

    return testing::print_summary("REMOTE CONTROL CLIENT");
}
