#pragma once
#include <optional>
#include <string>
#include "common/Result.hpp"

namespace interfaces {

    // Opaque key-value persistence for client settings (saved host list).
    class ISettingsStore {
    public:
        virtual ~ISettingsStore() = default;

        virtual std::optional<std::string> get(const std::string& key) const = 0;
        virtual common::EmptyResult set(const std::string& key, const std::string& value) = 0;
    };

}
