#pragma once

#include <QDate>
#include <QString>

namespace gantt {
namespace core {

class GanttStore;

// Drags a task bar along the time axis. Every update is measured from the
// press position against the dates captured at begin(), so no drift builds up.
class MoveSession
{
public:
    explicit MoveSession(GanttStore &store);

    bool begin(const QString &taskId, double pointerX, double dayWidth);
    void update(double pointerX);
    void end();
    // Puts the task back at its anchor dates and ends the session.
    void cancel();

    bool isActive() const;
    const QString &taskId() const;

private:
    void applyDelta(int daysDelta);
    void reset();

    GanttStore &m_store;
    QString m_taskId;
    QDate m_anchorStart;
    QDate m_anchorEnd;
    double m_pressX = 0.0;
    double m_dayWidth = 0.0;
    int m_appliedDelta = 0;
    bool m_active = false;
};

} // namespace core
} // namespace gantt
