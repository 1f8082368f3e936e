#include "courier/options.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace courier {

namespace {

    void require_object(const nlohmann::json& j) {
        if (!j.is_object())
            throw std::invalid_argument{"Invalid options: expected a JSON object"};
    }

    // Upper bound on any duration option; keeps backoff and expiry arithmetic far from overflow.
    constexpr int64_t MAX_DURATION_MS = int64_t{10} * 365 * 24 * 60 * 60 * 1000;

    // Returns the value of `key` if present, throwing unless it is an integer in [1, max].
    std::optional<int64_t> read_bounded(
            const nlohmann::json& j, const char* key, int64_t max, const char* what) {
        auto it = j.find(key);
        if (it == j.end())
            return std::nullopt;
        bool valid = false;
        if (it->is_number_unsigned())
            valid = it->get<uint64_t>() >= 1 && it->get<uint64_t>() <= static_cast<uint64_t>(max);
        else if (it->is_number_integer())
            valid = it->get<int64_t>() >= 1 && it->get<int64_t>() <= max;
        if (!valid)
            throw std::invalid_argument{
                    "Invalid options: '"s + key + "' must be " + what + " between 1 and " +
                    std::to_string(max)};
        return it->get<int64_t>();
    }

    void read_positive(const nlohmann::json& j, const char* key, int& out) {
        if (auto v = read_bounded(j, key, std::numeric_limits<int>::max(), "an integer"))
            out = static_cast<int>(*v);
    }

    void read_positive(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
        if (auto v = read_bounded(j, key, MAX_DURATION_MS, "a number of milliseconds"))
            out = std::chrono::milliseconds{*v};
    }

}  // namespace

std::chrono::milliseconds SyncOptions::retry_delay(int retry_count) const {
    auto delay = retry_base;
    for (int i = 0; i < retry_count && delay < retry_max; i++) {
        if (delay > retry_max / 2)
            return retry_max;
        delay *= 2;
    }
    return std::min(delay, retry_max);
}

void from_json(const nlohmann::json& j, SyncOptions& opts) {
    require_object(j);
    read_positive(j, "max_message_retries", opts.max_message_retries);
    read_positive(j, "default_action_retries", opts.default_action_retries);
    read_positive(j, "retry_base_ms", opts.retry_base);
    read_positive(j, "retry_max_ms", opts.retry_max);
    read_positive(j, "periodic_sync_ms", opts.periodic_sync);
    read_positive(j, "failed_message_ttl_ms", opts.failed_message_ttl);
}

void from_json(const nlohmann::json& j, MonitorOptions& opts) {
    require_object(j);
    read_positive(j, "health_check_interval_ms", opts.health_check_interval);
    read_positive(j, "stall_timeout_ms", opts.stall_timeout);
    read_positive(j, "max_sync_retries", opts.max_sync_retries);
    read_positive(j, "estimated_time_per_item_ms", opts.estimated_time_per_item);
}

}  // namespace courier
