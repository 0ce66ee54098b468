#pragma once

#include <functional>
#include <mutex>
#include <utility>

#include "causal/clock/vector_clock.hpp"

namespace causal {
namespace clock {

// Thread-safe clock of a single host. Serializes the read-increment-store
// cycle so that concurrent events of the same host are never lost.
template <typename HostId, typename Hash = std::hash<HostId>>
class HostClock {
   public:
    using clock_type = VectorClock<HostId, Hash>;

    explicit HostClock(HostId host) : host_(std::move(host)) {}

    HostClock(HostId host, clock_type initial)
        : host_(std::move(host)), clock_(std::move(initial)) {}

    HostClock(const HostClock &) = delete;
    HostClock &operator=(const HostClock &) = delete;

    auto host() const -> const HostId & {
        return host_;
    }

    auto now() const -> clock_type {
        std::lock_guard<std::mutex> lock(mutex_);
        return clock_;
    }

    /* Call on every local or send event */
    auto tick() -> clock_type {
        std::lock_guard<std::mutex> lock(mutex_);
        clock_ = clock_.incremented(host_);
        return clock_;
    }

    /* Call once for each received remote clock before applying its effects */
    auto observe(const clock_type &remote) -> clock_type {
        std::lock_guard<std::mutex> lock(mutex_);
        clock_ = clock_.merge_with(remote).incremented(host_);
        return clock_;
    }

   private:
    const HostId host_;
    mutable std::mutex mutex_;
    clock_type clock_;
};

}  // namespace clock
}  // namespace causal
