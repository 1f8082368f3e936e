#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace courier {

/// Handle returned by `Channel::subscribe`.  The subscription ends when `unsubscribe()` is called
/// or the handle is destroyed, whichever comes first; it is safe for the handle to outlive the
/// channel.
class Subscription {
  public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsub) : unsub_{std::move(unsub)} {}

    Subscription(Subscription&& other) noexcept : unsub_{std::move(other.unsub_)} {
        other.unsub_ = nullptr;
    }
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            unsub_ = std::move(other.unsub_);
            other.unsub_ = nullptr;
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    ~Subscription() { unsubscribe(); }

    void unsubscribe() {
        if (unsub_) {
            auto f = std::move(unsub_);
            unsub_ = nullptr;
            f();
        }
    }

    explicit operator bool() const { return static_cast<bool>(unsub_); }

  private:
    std::function<void()> unsub_;
};

/// Broadcast channel: every value published is delivered synchronously, in subscription order, to
/// all current subscribers.  Subscribers may subscribe or unsubscribe from within a callback; a
/// subscriber removed during a publish is not called for that value.
template <typename T>
class Channel {
  public:
    using callback_t = std::function<void(const T&)>;

    [[nodiscard]] Subscription subscribe(callback_t fn) {
        auto id = state_->next_id++;
        state_->subscribers.emplace(id, std::move(fn));
        return Subscription{[weak = std::weak_ptr<state>{state_}, id] {
            if (auto s = weak.lock())
                s->subscribers.erase(id);
        }};
    }

    void publish(const T& value) {
        // Hold a reference so a subscriber destroying the channel mid-publish is harmless.
        auto s = state_;
        std::vector<uint64_t> ids;
        ids.reserve(s->subscribers.size());
        for (auto& [id, fn] : s->subscribers)
            ids.push_back(id);
        for (auto id : ids) {
            auto it = s->subscribers.find(id);
            if (it == s->subscribers.end())
                continue;
            auto fn = it->second;
            fn(value);
        }
    }

    size_t subscriber_count() const { return state_->subscribers.size(); }

  private:
    struct state {
        uint64_t next_id = 1;
        std::map<uint64_t, callback_t> subscribers;
    };
    std::shared_ptr<state> state_ = std::make_shared<state>();
};

}  // namespace courier
