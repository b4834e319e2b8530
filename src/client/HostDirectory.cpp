#include "client/HostDirectory.hpp"
#include <algorithm>

namespace client {

HostDirectory::HostDirectory(std::shared_ptr<interfaces::ISettingsStore> store,
                             std::shared_ptr<common::ILogger> logger)
    : store_(std::move(store)),
      logger_(logger ? std::move(logger) : common::make_null_logger()) {
}

common::EmptyResult HostDirectory::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    hosts_.clear();

    auto stored = store_->get(SETTINGS_KEY);
    if (!stored) return common::EmptyResult::success();

    auto parsed = core::deserialize_host_list(*stored);
    if (parsed.is_err()) {
        logger_->warn("[HostDirectory] Ignoring saved hosts: " + parsed.error().message);
        return common::EmptyResult::err(parsed.error());
    }
    hosts_ = parsed.take();
    logger_->debug("[HostDirectory] Loaded " + std::to_string(hosts_.size()) + " saved hosts");
    return common::EmptyResult::success();
}

common::EmptyResult HostDirectory::remember(const core::HostRecord& host) {
    if (host.address.empty()) {
        return common::EmptyResult::err(common::ErrorCode::InvalidArgument, "host has no address");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    hosts_.erase(std::remove_if(hosts_.begin(), hosts_.end(),
                                [&host](const core::HostRecord& h) { return h.address == host.address; }),
                 hosts_.end());
    hosts_.push_back(host);
    return persist_locked();
}

common::Result<core::HostRecord> HostDirectory::add_manual(const std::string& endpoint, const std::string& name) {
    auto parsed = core::parse_host_endpoint(endpoint);
    if (parsed.is_err()) return parsed;

    core::HostRecord host = parsed.take();
    if (!name.empty()) host.name = name;

    auto saved = remember(host);
    if (saved.is_err()) return common::Result<core::HostRecord>::err(saved.error());
    return host;
}

bool HostDirectory::forget(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(hosts_.begin(), hosts_.end(),
                           [&address](const core::HostRecord& h) { return h.address == address; });
    if (it == hosts_.end()) return false;

    hosts_.erase(it);
    auto saved = persist_locked();
    if (saved.is_err()) {
        logger_->warn("[HostDirectory] " + saved.error().message);
    }
    return true;
}

std::vector<core::HostRecord> HostDirectory::hosts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hosts_;
}

common::EmptyResult HostDirectory::persist_locked() {
    return store_->set(SETTINGS_KEY, core::serialize_host_list(hosts_));
}

} // namespace client
