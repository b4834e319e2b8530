#include "client/FileSettingsStore.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace client {

using nlohmann::json;

FileSettingsStore::FileSettingsStore(std::string path)
    : path_(std::move(path)) {
}

common::EmptyResult FileSettingsStore::load() {
    std::ifstream in(path_);
    if (!in) return common::EmptyResult::success();

    std::stringstream buffer;
    buffer << in.rdbuf();

    json j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return common::EmptyResult::err(common::ErrorCode::InvalidArgument,
                                        "Settings file is not a JSON object: " + path_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) continue;
        values_[it.key()] = it.value().get<std::string>();
    }
    return common::EmptyResult::success();
}

std::optional<std::string> FileSettingsStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

common::EmptyResult FileSettingsStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;

    json j = json::object();
    for (const auto& entry : values_) {
        j[entry.first] = entry.second;
    }

    // Written beside the target, then renamed over it
    const std::string temp = path_ + ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return common::EmptyResult::err(common::ErrorCode::SystemError, "Cannot write " + temp);
        }
        out << j.dump(2) << "\n";
        if (!out) {
            return common::EmptyResult::err(common::ErrorCode::SystemError, "Write failed: " + temp);
        }
    }
    std::remove(path_.c_str());
    if (std::rename(temp.c_str(), path_.c_str()) != 0) {
        return common::EmptyResult::err(common::ErrorCode::SystemError, "Cannot replace " + path_);
    }
    return common::EmptyResult::success();
}

} // namespace client
