#pragma once

#include "gantt/core/GanttAction.hpp"
#include "gantt/core/GanttState.hpp"

namespace gantt {
namespace core {

// Pure transition function. Misses (unknown ids, out-of-range indices,
// unknown action types) return the state unchanged.
GanttState reduce(const GanttState &state, const Action &action);

} // namespace core
} // namespace gantt
