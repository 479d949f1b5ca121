#pragma once

#include <QDate>
#include <QString>
#include <utility>

#include "gantt/core/GanttState.hpp"

namespace gantt {
namespace core {

class GanttStore;

class ResizeSession
{
public:
    explicit ResizeSession(GanttStore &store);

    // Dispatches StartResize; the session stays idle for ResizeHandle::None.
    bool begin(const QString &taskId, ResizeHandle handle, double pointerX, double dayWidth);
    void update(double pointerX);
    // Dispatches EndResize.
    void end();
    void cancel();

    bool isActive() const;
    ResizeHandle handle() const;
    const QString &taskId() const;

    // Moves one edge of [anchorStart, anchorEnd] by daysDelta, keeping at
    // least one day between the edges.
    static std::pair<QDate, QDate> resizedInterval(const QDate &anchorStart,
                                                   const QDate &anchorEnd,
                                                   ResizeHandle handle,
                                                   int daysDelta);

private:
    void applyDelta(int daysDelta);
    void reset();

    GanttStore &m_store;
    QString m_taskId;
    ResizeHandle m_handle = ResizeHandle::None;
    QDate m_anchorStart;
    QDate m_anchorEnd;
    double m_pressX = 0.0;
    double m_dayWidth = 0.0;
    int m_appliedDelta = 0;
    bool m_active = false;
};

} // namespace core
} // namespace gantt
