#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace causal {
namespace clock {

// Causal relationship of a clock to another one, read left to right:
// `a.temporal_relation(b) == caused` means a happened-before b.
enum class TemporalRelation { equal, caused, effect_of, concurrent };

auto to_string(TemporalRelation relation) -> std::string_view;

// Per-host event counters. Hosts that were never incremented have an implicit
// count of 0 and are not stored, so every stored count is at least 1.
// Operations never modify the clock; they return a new one.
// Example:
//    VectorClock<std::string> base;
//    auto a = base.incremented("A");
//    auto b = base.incremented("B");
//    a.temporal_relation(b);  // concurrent
//    a.merge_with(b).temporal_relation(a);  // effect_of
template <typename HostId, typename Hash = std::hash<HostId>>
class VectorClock {
   public:
    using host_type = HostId;
    using entry_type = std::pair<HostId, uint64_t>;

    VectorClock() = default;

    // A host listed more than once takes its last count. Zero counts are
    // dropped.
    static auto from_entries(const std::vector<entry_type> &entries)
        -> VectorClock {
        VectorClock clock;
        for (const auto &[host, count] : entries) {
            clock.entries_[host] = count;
        }
        std::erase_if(clock.entries_,
                      [](const auto &entry) { return entry.second == 0; });
        return clock;
    }

    // Explicit entries in unspecified order, without duplicates.
    auto to_entries() const -> std::vector<entry_type> {
        return std::vector<entry_type>(entries_.begin(), entries_.end());
    }

    auto count(const HostId &host) const -> uint64_t {
        auto it = entries_.find(host);
        return it == entries_.end() ? 0 : it->second;
    }

    auto size() const -> size_t {
        return entries_.size();
    }

    auto empty() const -> bool {
        return entries_.empty();
    }

    // Throws std::overflow_error when the host's count is already at the
    // maximum; wrapping to 0 would reorder the clock before its past.
    [[nodiscard]] auto incremented(const HostId &host) const -> VectorClock {
        if (count(host) == std::numeric_limits<uint64_t>::max()) {
            throw std::overflow_error("vector clock count overflow");
        }
        VectorClock next(*this);
        ++next.entries_[host];
        return next;
    }

    // Pointwise maximum over the hosts of both clocks.
    [[nodiscard]] auto merge_with(const VectorClock &other) const
        -> VectorClock {
        VectorClock merged(*this);
        for (const auto &[host, other_count] : other.entries_) {
            auto &count = merged.entries_[host];
            count = std::max(count, other_count);
        }
        return merged;
    }

    auto temporal_relation(const VectorClock &other) const
        -> TemporalRelation {
        if (entries_ == other.entries_) {
            return TemporalRelation::equal;
        } else if (superseded_by(other)) {
            return TemporalRelation::caused;
        } else if (other.superseded_by(*this)) {
            return TemporalRelation::effect_of;
        }
        return TemporalRelation::concurrent;
    }

    friend auto operator==(const VectorClock &a, const VectorClock &b)
        -> bool {
        return a.entries_ == b.entries_;
    }

   private:
    // True when every host's count here is <= its count in `other` and at
    // least one is strictly smaller. Both maps must be scanned: a host that
    // only `other` knows about is invisible from this side.
    auto superseded_by(const VectorClock &other) const -> bool {
        bool has_smaller = false;

        for (const auto &[host, self_count] : entries_) {
            uint64_t other_count = other.count(host);
            if (self_count > other_count) return false;
            has_smaller = has_smaller || self_count < other_count;
        }

        for (const auto &[host, other_count] : other.entries_) {
            uint64_t self_count = count(host);
            if (self_count > other_count) return false;
            has_smaller = has_smaller || self_count < other_count;
        }

        return has_smaller;
    }

    std::unordered_map<HostId, uint64_t, Hash> entries_;
};

}  // namespace clock
}  // namespace causal

template <>
struct std::formatter<causal::clock::TemporalRelation>
    : std::formatter<std::string_view> {
    auto format(causal::clock::TemporalRelation relation,
                std::format_context &ctx) const {
        return std::formatter<std::string_view>::format(
            causal::clock::to_string(relation), ctx);
    }
};

// Formats as `{A:1, B:2}` with hosts in ascending order.
template <typename HostId, typename Hash>
struct std::formatter<causal::clock::VectorClock<HostId, Hash>> {
    constexpr auto parse(std::format_parse_context &ctx) {
        return ctx.begin();
    }

    auto format(const causal::clock::VectorClock<HostId, Hash> &clock,
                std::format_context &ctx) const {
        auto entries = clock.to_entries();
        std::ranges::sort(entries);
        auto out = ctx.out();
        *out++ = '{';
        for (size_t i = 0; i < entries.size(); ++i) {
            out = std::format_to(out, "{}{}:{}", i == 0 ? "" : ", ",
                                 entries[i].first, entries[i].second);
        }
        *out++ = '}';
        return out;
    }
};
