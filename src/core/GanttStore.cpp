#include "gantt/core/GanttStore.hpp"

#include "gantt/core/GanttReducer.hpp"
#include "gantt/core/Logging.hpp"

namespace gantt {
namespace core {

GanttStore::GanttStore(GanttState initialState, QObject *parent)
    : QObject(parent)
    , m_state(std::move(initialState))
{
    qRegisterMetaType<GanttState>();
    m_state.zoomLevel = clampZoomLevel(m_state.zoomLevel);
}

const GanttState &GanttStore::state() const
{
    return m_state;
}

void GanttStore::dispatch(const Action &action)
{
    ++m_dispatchCount;
    GanttState next = reduce(m_state, action);
    if (next == m_state) {
        qCDebug(lcGanttStore) << "No change from" << actionTypeName(action.type) << action.taskId;
        return;
    }
    qCDebug(lcGanttStore) << "Applied" << actionTypeName(action.type) << action.taskId;
    m_state = std::move(next);
    emit stateChanged(m_state);
}

std::size_t GanttStore::dispatchCount() const
{
    return m_dispatchCount;
}

} // namespace core
} // namespace gantt
