#include "gantt/core/MoveSession.hpp"

#include "gantt/core/GanttStore.hpp"
#include "gantt/core/Logging.hpp"
#include "gantt/core/TaskTree.hpp"
#include "gantt/core/TimelineGeometry.hpp"

namespace gantt {
namespace core {

MoveSession::MoveSession(GanttStore &store)
    : m_store(store)
{
}

bool MoveSession::begin(const QString &taskId, double pointerX, double dayWidth)
{
    if (m_active || dayWidth <= 0.0) {
        return false;
    }
    const auto task = findTask(m_store.state().tasks, taskId);
    if (!task) {
        return false;
    }
    m_taskId = taskId;
    m_anchorStart = task->startDate;
    m_anchorEnd = task->endDate;
    m_pressX = pointerX;
    m_dayWidth = dayWidth;
    m_appliedDelta = 0;
    m_active = true;
    qCDebug(lcGanttInteraction) << "Move started" << taskId << m_anchorStart << m_anchorEnd;
    return true;
}

void MoveSession::update(double pointerX)
{
    if (!m_active) {
        return;
    }
    const int daysDelta = daysForPixelDelta(pointerX - m_pressX, m_dayWidth);
    if (daysDelta == m_appliedDelta) {
        return;
    }
    applyDelta(daysDelta);
}

void MoveSession::end()
{
    if (!m_active) {
        return;
    }
    qCDebug(lcGanttInteraction) << "Move finished" << m_taskId << "by" << m_appliedDelta << "days";
    reset();
}

void MoveSession::cancel()
{
    if (!m_active) {
        return;
    }
    if (m_appliedDelta != 0) {
        applyDelta(0);
    }
    qCDebug(lcGanttInteraction) << "Move cancelled" << m_taskId;
    reset();
}

bool MoveSession::isActive() const
{
    return m_active;
}

const QString &MoveSession::taskId() const
{
    return m_taskId;
}

void MoveSession::applyDelta(int daysDelta)
{
    data::TaskUpdate update;
    update.startDate = m_anchorStart.addDays(daysDelta);
    update.endDate = m_anchorEnd.addDays(daysDelta);
    m_appliedDelta = daysDelta;
    m_store.dispatch(Action::updateTask(m_taskId, update));
}

void MoveSession::reset()
{
    m_active = false;
    m_taskId.clear();
    m_anchorStart = QDate();
    m_anchorEnd = QDate();
    m_appliedDelta = 0;
}

} // namespace core
} // namespace gantt
