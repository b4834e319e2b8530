#pragma once

#include <map>
#include <mutex>
#include <string>
#include "interfaces/ISettingsStore.hpp"

namespace client {

// Key-value settings kept as one JSON object in a file. The whole file is
// rewritten on every set().
class FileSettingsStore : public interfaces::ISettingsStore {
public:
    explicit FileSettingsStore(std::string path);

    // Read the file. A missing file is an empty store.
    common::EmptyResult load();

    std::optional<std::string> get(const std::string& key) const override;
    common::EmptyResult set(const std::string& key, const std::string& value) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

} // namespace client
