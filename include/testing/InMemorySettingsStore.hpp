#pragma once
#include "interfaces/ISettingsStore.hpp"
#include <map>
#include <mutex>

namespace testing {

    class InMemorySettingsStore : public interfaces::ISettingsStore {
    public:
        std::optional<std::string> get(const std::string& key) const override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = values_.find(key);
            if (it == values_.end()) return std::nullopt;
            return it->second;
        }

        common::EmptyResult set(const std::string& key, const std::string& value) override {
            std::lock_guard<std::mutex> lock(mutex_);
            ++writes_;
            values_[key] = value;
            return common::EmptyResult::success();
        }

        int writes() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return writes_;
        }

    private:
        mutable std::mutex mutex_;
        std::map<std::string, std::string> values_;
        int writes_ = 0;
    };

} // namespace testing
