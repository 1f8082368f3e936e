#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "queue_store.hpp"

namespace courier {

/// Completion callback handed to every transport hook.  `success` reports whether the remote
/// operation was accepted; on failure `status_code` is the HTTP status returned by the service, or
/// 0 if no response was received (network error), and `response` carries the error text.
using response_callback_t =
        std::function<void(bool success, int16_t status_code, std::string response)>;

// Delivers one queued message; `item.id` should be forwarded to the service for deduplication.
using send_hook_t = std::function<void(const QueueItem& item, response_callback_t on_response)>;

template <typename Action>
using action_hook_t = std::function<void(const Action& action, response_callback_t on_response)>;

/// Returns true for responses that are not worth retrying: any 4xx other than 429.
inline bool is_permanent_failure(int16_t status_code) {
    return status_code >= 400 && status_code < 500 && status_code != 429;
}

}  // namespace courier
