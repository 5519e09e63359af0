#include "timer_queue.hpp"

#include <vector>

namespace charkit {

TimerQueue::TimerQueue()
: clock_([] { return SDL_GetTicks64(); }) {}

TimerQueue::TimerQueue(Clock clock)
: clock_(std::move(clock)) {}

Uint64 TimerQueue::now() const {
    return clock_ ? clock_() : 0;
}

TimerId TimerQueue::after(Uint32 delay_ms, Callback callback) {
    const TimerId id = next_id_++;
    const Key key{now() + delay_ms, id};
    timers_.emplace(key, std::move(callback));
    index_.emplace(id, key);
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    timers_.erase(it->second);
    index_.erase(it);
    return true;
}

void TimerQueue::clear() {
    timers_.clear();
    index_.clear();
}

bool TimerQueue::is_pending(TimerId id) const {
    return index_.find(id) != index_.end();
}

std::optional<Uint64> TimerQueue::next_deadline() const {
    if (timers_.empty()) {
        return std::nullopt;
    }
    return timers_.begin()->first.first;
}

std::size_t TimerQueue::run_due() {
    const Uint64 current = now();

    std::vector<TimerId> due;
    for (const auto& entry : timers_) {
        if (entry.first.first > current) {
            break;
        }
        due.push_back(entry.first.second);
    }

    std::size_t ran = 0;
    for (TimerId id : due) {
        // An earlier callback in this pass may have cancelled it.
        auto it = index_.find(id);
        if (it == index_.end()) {
            continue;
        }
        auto timer_it = timers_.find(it->second);
        Callback callback = std::move(timer_it->second);
        timers_.erase(timer_it);
        index_.erase(it);
        if (callback) {
            callback();
        }
        ++ran;
    }
    return ran;
}

}
