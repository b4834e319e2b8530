#pragma once
#include "interfaces/IConnection.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace testing {

    // In-memory host connection: keeps what the host sent and whether it hung up
    class FakeConnection : public interfaces::IConnection {
    public:
        explicit FakeConnection(std::string address = "10.0.0.2")
            : address_(std::move(address)) {}

        common::EmptyResult send_text(const std::string& text) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return common::EmptyResult::err(common::ErrorCode::TransportError, "connection closed");
            }
            sent_.push_back(text);
            return common::EmptyResult::success();
        }

        void close() override {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            ++close_calls_;
        }

        std::string remote_address() const override { return address_; }

        std::vector<std::string> sent() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return sent_;
        }

        std::string last_sent() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return sent_.empty() ? std::string() : sent_.back();
        }

        bool closed() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

        int close_calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return close_calls_;
        }

    private:
        std::string address_;
        mutable std::mutex mutex_;
        std::vector<std::string> sent_;
        bool closed_ = false;
        int close_calls_ = 0;
    };

} // namespace testing
