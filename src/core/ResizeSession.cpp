#include "gantt/core/ResizeSession.hpp"

#include "gantt/core/GanttStore.hpp"
#include "gantt/core/Logging.hpp"
#include "gantt/core/TaskTree.hpp"
#include "gantt/core/TimelineGeometry.hpp"

namespace gantt {
namespace core {

ResizeSession::ResizeSession(GanttStore &store)
    : m_store(store)
{
}

std::pair<QDate, QDate> ResizeSession::resizedInterval(const QDate &anchorStart,
                                                       const QDate &anchorEnd,
                                                       ResizeHandle handle,
                                                       int daysDelta)
{
    QDate newStart = anchorStart;
    QDate newEnd = anchorEnd;
    if (handle == ResizeHandle::Start) {
        newStart = anchorStart.addDays(daysDelta);
        if (newStart >= anchorEnd) {
            newStart = anchorEnd.addDays(-1);
        }
    } else if (handle == ResizeHandle::End) {
        newEnd = anchorEnd.addDays(daysDelta);
        if (newEnd <= anchorStart) {
            newEnd = anchorStart.addDays(1);
        }
    }
    return { newStart, newEnd };
}

bool ResizeSession::begin(const QString &taskId, ResizeHandle handle, double pointerX, double dayWidth)
{
    if (m_active || handle == ResizeHandle::None || dayWidth <= 0.0) {
        return false;
    }
    const auto task = findTask(m_store.state().tasks, taskId);
    if (!task) {
        return false;
    }
    m_taskId = taskId;
    m_handle = handle;
    m_anchorStart = task->startDate;
    m_anchorEnd = task->endDate;
    m_pressX = pointerX;
    m_dayWidth = dayWidth;
    m_appliedDelta = 0;
    m_active = true;
    qCDebug(lcGanttInteraction) << "Resize started" << taskId
                                << (handle == ResizeHandle::Start ? "start" : "end");
    m_store.dispatch(Action::startResize(taskId, handle));
    return true;
}

void ResizeSession::update(double pointerX)
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

void ResizeSession::end()
{
    if (!m_active) {
        return;
    }
    qCDebug(lcGanttInteraction) << "Resize finished" << m_taskId;
    reset();
    m_store.dispatch(Action::endResize());
}

void ResizeSession::cancel()
{
    if (!m_active) {
        return;
    }
    if (m_appliedDelta != 0) {
        m_store.dispatch(Action::resizeTask(m_taskId, m_anchorStart, m_anchorEnd));
    }
    qCDebug(lcGanttInteraction) << "Resize cancelled" << m_taskId;
    reset();
    m_store.dispatch(Action::endResize());
}

bool ResizeSession::isActive() const
{
    return m_active;
}

ResizeHandle ResizeSession::handle() const
{
    return m_handle;
}

const QString &ResizeSession::taskId() const
{
    return m_taskId;
}

void ResizeSession::applyDelta(int daysDelta)
{
    const auto interval = resizedInterval(m_anchorStart, m_anchorEnd, m_handle, daysDelta);
    m_appliedDelta = daysDelta;
    m_store.dispatch(Action::resizeTask(m_taskId, interval.first, interval.second));
}

void ResizeSession::reset()
{
    m_active = false;
    m_taskId.clear();
    m_handle = ResizeHandle::None;
    m_anchorStart = QDate();
    m_anchorEnd = QDate();
    m_appliedDelta = 0;
}

} // namespace core
} // namespace gantt
