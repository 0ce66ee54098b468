#include "causal/clock/vector_clock.hpp"

#include <utility>

namespace causal {
namespace clock {

auto to_string(TemporalRelation relation) -> std::string_view {
    switch (relation) {
        case TemporalRelation::equal:
            return "equal";
        case TemporalRelation::caused:
            return "caused";
        case TemporalRelation::effect_of:
            return "effect_of";
        case TemporalRelation::concurrent:
            return "concurrent";
    }
    std::unreachable();
}

}  // namespace clock
}  // namespace causal
