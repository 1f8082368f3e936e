#pragma once

#include <oxenc/hex.h>

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "courier/log.hpp"
#include "courier/queue_store.hpp"
#include "courier/transport.hpp"
#include "courier/types.hpp"
#include "courier/util.hpp"

using courier::ustring;
using courier::ustring_view;

using namespace std::literals;

inline ustring operator""_bytes(const char* x, size_t n) {
    return {reinterpret_cast<const unsigned char*>(x), n};
}

inline std::string to_hex(ustring_view bytes) {
    std::string hex;
    oxenc::to_hex(bytes.begin(), bytes.end(), std::back_inserter(hex));
    return hex;
}

inline constexpr auto operator""_kiB(unsigned long long kiB) {
    return kiB * 1024;
}

inline std::string_view to_sv(ustring_view x) {
    return {reinterpret_cast<const char*>(x.data()), x.size()};
}
inline ustring_view to_usv(std::string_view x) {
    return {reinterpret_cast<const unsigned char*>(x.data()), x.size()};
}

template <typename Container>
std::set<typename Container::value_type> as_set(const Container& c) {
    return {c.begin(), c.end()};
}

// Manually advanced clock; starts at 2024-01-01T00:00:00Z.
struct fake_clock {
    courier::sys_ms now = courier::from_epoch_ms(1'704'067'200'000);

    courier::clock_fn fn() {
        return [this] { return now; };
    }

    void advance(std::chrono::milliseconds d) { now += d; }
};

// Collects log lines, e.g. `engine.logger = logs.fn();`.
struct captured_logs {
    std::vector<std::pair<courier::LogLevel, std::string>> lines;

    courier::logger_fn fn() {
        return [this](courier::LogLevel lvl, std::string msg) {
            lines.emplace_back(lvl, std::move(msg));
        };
    }

    size_t count(courier::LogLevel lvl) const {
        size_t n = 0;
        for (auto& [l, m] : lines)
            if (l == lvl)
                n++;
        return n;
    }
};

struct last_send_data {
    courier::QueueItem item;
    courier::response_callback_t response_cb;
};

// Send hook that records every request; the test completes them by calling `respond`.  With
// `auto_status` set, requests are instead completed immediately with that status (200 for
// success, 0 for a network error, anything else for an HTTP failure).
struct fake_transport {
    std::deque<last_send_data> outstanding;
    std::vector<courier::QueueItem> sent;
    std::optional<int16_t> auto_status;

    courier::send_hook_t hook() {
        return [this](const courier::QueueItem& item, courier::response_callback_t cb) {
            sent.push_back(item);
            if (auto_status)
                complete(*auto_status, std::move(cb));
            else
                outstanding.push_back({item, std::move(cb)});
        };
    }

    // Completes the oldest outstanding request.
    void respond(int16_t status) {
        auto req = std::move(outstanding.front());
        outstanding.pop_front();
        complete(status, std::move(req.response_cb));
    }

    static void complete(int16_t status, courier::response_callback_t cb) {
        bool ok = status >= 200 && status < 300;
        cb(ok, status, ok ? "" : status == 0 ? "Network error" : "rejected");
    }
};
