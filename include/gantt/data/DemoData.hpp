#pragma once

#include "gantt/data/Task.hpp"

namespace gantt {
namespace data {

// Project plan shown on first start: two phases with subtasks and a milestone.
TaskList createDemoTasks();

} // namespace data
} // namespace gantt
