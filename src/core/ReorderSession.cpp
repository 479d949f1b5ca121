#include "gantt/core/ReorderSession.hpp"

#include "gantt/core/GanttStore.hpp"
#include "gantt/core/Logging.hpp"
#include "gantt/core/TaskTree.hpp"

namespace gantt {
namespace core {

ReorderSession::ReorderSession(GanttStore &store)
    : m_store(store)
{
}

std::optional<std::pair<int, int>> ReorderSession::resolveIndices(const data::TaskList &roots,
                                                                  const QString &activeId,
                                                                  const QString &overId)
{
    if (activeId == overId) {
        return std::nullopt;
    }
    const int sourceIndex = rootIndexOf(roots, activeId);
    const int destinationIndex = rootIndexOf(roots, overId);
    if (sourceIndex < 0 || destinationIndex < 0) {
        return std::nullopt;
    }
    return std::make_pair(sourceIndex, destinationIndex);
}

bool ReorderSession::begin(const QStringList &displayedRootIds, const QString &taskId)
{
    if (m_active || !displayedRootIds.contains(taskId)) {
        return false;
    }
    const auto &roots = m_store.state().tasks;
    const int index = rootIndexOf(roots, taskId);
    if (index < 0) {
        return false;
    }
    m_displayedIds = displayedRootIds;
    m_taskId = taskId;
    m_active = true;
    qCDebug(lcGanttInteraction) << "Reorder started" << taskId;
    m_store.dispatch(Action::startDrag(roots.at(index)));
    return true;
}

bool ReorderSession::drop(const QString &overId)
{
    if (!m_active) {
        return false;
    }
    if (!m_displayedIds.contains(overId)) {
        cancel();
        return false;
    }
    const auto indices = resolveIndices(m_store.state().tasks, m_taskId, overId);
    if (!indices) {
        cancel();
        return false;
    }
    qCDebug(lcGanttInteraction) << "Reorder" << m_taskId << "onto" << overId << indices->first << "->"
                                << indices->second;
    m_store.dispatch(Action::reorderTasks(indices->first, indices->second));
    finish();
    return true;
}

void ReorderSession::cancel()
{
    if (!m_active) {
        return;
    }
    qCDebug(lcGanttInteraction) << "Reorder cancelled" << m_taskId;
    finish();
}

bool ReorderSession::isActive() const
{
    return m_active;
}

const QString &ReorderSession::taskId() const
{
    return m_taskId;
}

void ReorderSession::finish()
{
    m_active = false;
    m_taskId.clear();
    m_displayedIds.clear();
    m_store.dispatch(Action::endDrag());
}

} // namespace core
} // namespace gantt
