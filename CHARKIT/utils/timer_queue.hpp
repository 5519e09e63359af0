#pragma once

#include <SDL.h>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <utility>

namespace charkit {

using TimerId = std::uint64_t;

// Deferred callbacks run from the application loop ("after N ms, call f").
// Single-threaded: schedule, cancel and run_due must be called from the
// thread that owns the loop.
class TimerQueue {
public:
    using Callback = std::function<void()>;
    using Clock    = std::function<Uint64()>;

    TimerQueue();
    explicit TimerQueue(Clock clock);

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    TimerId after(Uint32 delay_ms, Callback callback);
    bool cancel(TimerId id);
    void clear();

    // Runs every callback due at the current time. Callbacks scheduled while
    // running are left for the next call even when already due.
    std::size_t run_due();

    std::size_t pending() const { return timers_.size(); }
    bool is_pending(TimerId id) const;
    std::optional<Uint64> next_deadline() const;
    Uint64 now() const;

private:
    // (deadline, sequence) keeps equal deadlines in scheduling order.
    using Key = std::pair<Uint64, TimerId>;

    Clock clock_;
    TimerId next_id_ = 1;
    std::map<Key, Callback> timers_;
    std::map<TimerId, Key> index_;
};

}
