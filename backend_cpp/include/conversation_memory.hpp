#pragma once
#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>
#include "comparison_types.hpp"

namespace comparables_rag {

// Bounded FIFO of (query, response) turns, oldest first.
class ConversationMemory {
public:
    static constexpr size_t kCapacity = 10;

    void append(const std::string& user, const std::string& assistant) {
        std::lock_guard<std::mutex> lock(mtx_);
        turns_.push_back({current_timestamp(), user, assistant});
        while (turns_.size() > kCapacity) {
            turns_.pop_front();
        }
    }

    std::vector<ConversationTurn> history() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return {turns_.begin(), turns_.end()};
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        turns_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return turns_.size();
    }

    static constexpr size_t capacity() { return kCapacity; }

    nlohmann::json history_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        for (const auto& turn : turns_) {
            j_list.push_back(turn.to_json());
        }
        return j_list;
    }

private:
    // Local time, ISO-8601 with microseconds.
    static std::string current_timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
            now.time_since_epoch()).count() % 1000000;
        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);
        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setw(6) << std::setfill('0') << micros;
        return oss.str();
    }

    std::deque<ConversationTurn> turns_;
    mutable std::mutex mtx_;
};

} // namespace comparables_rag
