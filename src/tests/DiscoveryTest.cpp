// ============================================================================
// Discovery and host directory tests
// ============================================================================
// Reply de-duplication, the persisted host list, the JSON settings file and
// a loopback responder/scanner exchange over real UDP sockets.
//
// Run with: ./DiscoveryTest
// ============================================================================

#include <atomic>
#include <chrono>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "client/DiscoveryScanner.hpp"
#include "client/FileSettingsStore.hpp"
#include "client/HostDirectory.hpp"
#include "core/DiscoveryResponder.hpp"
#include "core/NetworkDefs.hpp"
#include "testing/InMemorySettingsStore.hpp"
#include "testing/TestReport.hpp"

using namespace std::chrono_literals;
using core::HostRecord;
using testing::log_test;

namespace {

HostRecord host(const std::string& name, const std::string& address, uint16_t port = 8765) {
    HostRecord h;
    h.name = name;
    h.address = address;
    h.port = port;
    return h;
}

void test_collector() {
    testing::section("Discovery collector");

    client::DiscoveryCollector collector;
    bool first = collector.add(host("Desk", "10.0.0.5"));
    bool second = collector.add(host("Laptop", "10.0.0.6"));
    bool duplicate = collector.add(host("Desk (again)", "10.0.0.5"));

    log_test("new addresses are added", first && second);
    log_test("same address collapses to one record", !duplicate && collector.hosts().size() == 2);
    log_test("first reply wins within a window", collector.hosts()[0].name == "Desk");

    collector.clear();
    log_test("clear starts a new window", collector.hosts().empty() && collector.add(host("Desk", "10.0.0.5")));
}

void test_directory() {
    testing::section("Host directory");

    auto store = std::make_shared<testing::InMemorySettingsStore>();
    client::HostDirectory directory(store, common::make_null_logger());

    log_test("missing key loads as empty", directory.load().is_ok() && directory.hosts().empty());

    directory.remember(host("A", "10.0.0.1"));
    directory.remember(host("B", "10.0.0.2"));
    directory.remember(host("A renamed", "10.0.0.1", 9000));

    auto hosts = directory.hosts();
    log_test("remembering a known address moves it to the end",
             hosts.size() == 2 && hosts[0].address == "10.0.0.2" && hosts[1].name == "A renamed" &&
             hosts[1].port == 9000);
    log_test("every change is persisted", store->writes() == 3 &&
                                             store->get(client::HostDirectory::SETTINGS_KEY).has_value());

    client::HostDirectory reloaded(store, common::make_null_logger());
    log_test("list reloads in order", reloaded.load().is_ok() && reloaded.hosts() == hosts);

    auto manual = directory.add_manual("192.168.4.4:9100", "Garage");
    log_test("manual entry", manual.is_ok() && manual.unwrap().address == "192.168.4.4" &&
                                 manual.unwrap().port == 9100 && directory.hosts().back().name == "Garage");
    log_test("bad manual entry rejected", directory.add_manual(":80").is_err());
    log_test("record without address rejected", directory.remember(HostRecord{}).is_err());

    log_test("forget known host", directory.forget("10.0.0.2") && directory.hosts().size() == 2);
    log_test("forget unknown host", !directory.forget("10.9.9.9"));

    auto corrupt = std::make_shared<testing::InMemorySettingsStore>();
    corrupt->set(client::HostDirectory::SETTINGS_KEY, "not json");
    client::HostDirectory broken(corrupt, common::make_null_logger());
    log_test("corrupt stored list is reported and ignored", broken.load().is_err() && broken.hosts().empty());
}

void test_file_store() {
    testing::section("Settings file");

    const std::string path = "discovery_test_settings.json";
    std::remove(path.c_str());

    {
        client::FileSettingsStore store(path);
        log_test("missing file loads as empty", store.load().is_ok() && !store.get("saved_servers").has_value());
        log_test("set writes the file", store.set("saved_servers", "[]").is_ok() && store.set("theme", "dark").is_ok());
    }
    {
        client::FileSettingsStore store(path);
        log_test("values survive a reload", store.load().is_ok() && store.get("saved_servers") == std::string("[]") &&
                                                store.get("theme") == std::string("dark"));
    }
    {
        FILE* f = std::fopen(path.c_str(), "w");
        if (f) {
            std::fputs("[1,2", f);
            std::fclose(f);
        }
        client::FileSettingsStore store(path);
        log_test("corrupt file is an error", store.load().is_err());
    }
    std::remove(path.c_str());
}

void test_loopback() {
    testing::section("Loopback discovery");

    HostRecord advertisement;
    advertisement.name = "Loopback Host";
    advertisement.advertised_ip = "127.0.0.1";
    advertisement.port = 8765;
    advertisement.version = "2.0";
    advertisement.pin_required = true;
    advertisement.capabilities = {"mouse", "keyboard", "hotkeys", "scroll"};

    core::DiscoveryResponder responder(0, advertisement, common::make_null_logger());
    auto started = responder.start();
    log_test("responder binds a free port", started.is_ok() && responder.port() != 0,
             started.is_err() ? started.error().message : "");
    if (started.is_err()) return;
    log_test("second start is a no-op", responder.start().is_ok() && responder.is_running());

    client::DiscoverySettings settings;
    settings.broadcast_address = "127.0.0.1";
    settings.port = responder.port();
    settings.window = 500ms;
    settings.interval = 200ms;
    client::DiscoveryScanner scanner(settings, common::make_null_logger());

    common::CancellationSource source;
    auto t0 = std::chrono::steady_clock::now();
    auto found = scanner.scan_once(source.get_token());
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);

    bool ok = found.is_ok() && found.unwrap().size() == 1;
    log_test("scan finds the responder", ok, found.is_err() ? found.error().message : "");
    if (ok) {
        const auto& h = found.unwrap()[0];
        log_test("record fields", h.name == "Loopback Host" && h.address == "127.0.0.1" && h.port == 8765 &&
                                      h.pin_required && h.version == "2.0" && h.capabilities.size() == 4);
    }
    log_test("scan lasts the whole window", elapsed >= 450ms, std::to_string(elapsed.count()) + "ms");

    log_test("request literal tolerates whitespace",
             core::DiscoveryResponder::is_discovery_request("  remotemouse:discover\n") &&
             !core::DiscoveryResponder::is_discovery_request("remotemouse:discover2") &&
             !core::DiscoveryResponder::is_discovery_request(""));

    // Unrelated datagrams must not stop the responder
    socket_t probe = socket(AF_INET, SOCK_DGRAM, 0);
    if (IS_VALID_SOCKET(probe)) {
        sockaddr_in target{};
        target.sin_family = AF_INET;
        target.sin_port = htons(responder.port());
        inet_pton(AF_INET, "127.0.0.1", &target.sin_addr);
        const char junk[] = "hello?";
        sendto(probe, (const SOCK_BUF_TYPE)junk, sizeof(junk) - 1, 0, (struct sockaddr*)&target, sizeof(target));
        CLOSE_SOCKET(probe);
    }

    std::mutex mutex;
    std::vector<size_t> batches;
    scanner.start([&](const std::vector<HostRecord>& hosts) {
        std::lock_guard<std::mutex> lock(mutex);
        batches.push_back(hosts.size());
    });
    bool repeated = testing::wait_until([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return batches.size() >= 2;
    }, 5000ms);
    log_test("periodic scanning repeats", repeated);
    {
        std::lock_guard<std::mutex> lock(mutex);
        bool never_duplicated = !batches.empty();
        for (size_t n : batches) never_duplicated = never_duplicated && n == 1;
        log_test("repeated scans never duplicate the host", never_duplicated);
    }

    auto stop_start = std::chrono::steady_clock::now();
    scanner.stop();
    auto stop_elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - stop_start);
    log_test("stop is prompt", stop_elapsed < 400ms && !scanner.is_running(), std::to_string(stop_elapsed.count()) + "ms");

    responder.stop();
    responder.stop();
    log_test("responder stop is idempotent", !responder.is_running());

    auto after = scanner.scan_once(source.get_token());
    log_test("no replies once stopped", after.is_ok() && after.unwrap().empty());
}

} // namespace

int main() {
    std::cout << "Discovery Test Suite" << std::endl;
    std::cout << "====================" << std::endl;

    init_network();

    test_collector();
    test_directory();
    test_file_store();
    test_loopback();

    cleanup_network();
    return testing::print_summary("DISCOVERY");
}
