#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/HostRecord.hpp"
#include "interfaces/ISettingsStore.hpp"

namespace client {

/**
 * @brief Persisted, insertion-ordered list of known hosts.
 *
 * Hosts are unique by address. Remembering a host that is already listed
 * moves it to the end with the newer metadata. Every change is written
 * through to the settings store under SETTINGS_KEY.
 */
class HostDirectory {
public:
    static constexpr const char* SETTINGS_KEY = "saved_servers";

    HostDirectory(std::shared_ptr<interfaces::ISettingsStore> store,
                  std::shared_ptr<common::ILogger> logger);

    // Read the stored list. A missing key is an empty list; unreadable
    // contents are reported and leave the list empty.
    common::EmptyResult load();

    common::EmptyResult remember(const core::HostRecord& host);

    // Parse "host[:port]" and remember it
    common::Result<core::HostRecord> add_manual(const std::string& endpoint, const std::string& name = "");

    // Returns false if no host had that address
    bool forget(const std::string& address);

    std::vector<core::HostRecord> hosts() const;

private:
    common::EmptyResult persist_locked();

    std::shared_ptr<interfaces::ISettingsStore> store_;
    std::shared_ptr<common::ILogger> logger_;
    mutable std::mutex mutex_;
    std::vector<core::HostRecord> hosts_;
};

} // namespace client
