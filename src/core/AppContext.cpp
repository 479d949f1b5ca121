#include "gantt/core/AppContext.hpp"

#include "gantt/core/GanttStore.hpp"
#include "gantt/data/DemoData.hpp"

namespace gantt {
namespace core {

namespace {
GanttState seededState()
{
    GanttState state;
    state.tasks = data::createDemoTasks();
    return state;
}
} // namespace

AppContext::AppContext()
    : m_store(std::make_unique<GanttStore>(seededState()))
{
}

AppContext::~AppContext() = default;

GanttStore &AppContext::store()
{
    return *m_store;
}

} // namespace core
} // namespace gantt
