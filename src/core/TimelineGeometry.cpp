#include "gantt/core/TimelineGeometry.hpp"

#include <QtGlobal>
#include <cmath>

namespace gantt {
namespace core {

namespace {
constexpr double DayModeDayWidth = 48.0;
constexpr double WeekModeDayWidth = 24.0;
constexpr double MonthModeDayWidth = 8.0;
constexpr int DayModeSpanDays = 49;
constexpr int WeekModeSpanDays = 84;
constexpr int MonthModeLookaheadDays = 365;

QDate startOfWeek(const QDate &date)
{
    // Weeks start on Sunday; dayOfWeek() is 1 (Mon) .. 7 (Sun).
    return date.addDays(-(date.dayOfWeek() % 7));
}

QDate startOfMonth(const QDate &date)
{
    return QDate(date.year(), date.month(), 1);
}

QDate endOfMonth(const QDate &date)
{
    return QDate(date.year(), date.month(), date.daysInMonth());
}
} // namespace

int TimelineRange::dayCount() const
{
    if (!start.isValid() || !end.isValid()) {
        return 0;
    }
    return qMax(0, daysBetween(start, end) + 1);
}

int daysBetween(const QDate &from, const QDate &to)
{
    return static_cast<int>(from.daysTo(to));
}

int taskDuration(const QDate &start, const QDate &end)
{
    return qMax(1, daysBetween(start, end) + 1);
}

double effectiveDayWidth(double baseDayWidth, double zoomLevel)
{
    return baseDayWidth * zoomLevel;
}

TaskBarGeometry taskPosition(const data::Task &task, const QDate &origin, double dayWidth)
{
    const int startOffset = qMax(0, daysBetween(origin, task.startDate));
    const int duration = taskDuration(task.startDate, task.endDate);

    TaskBarGeometry geometry;
    geometry.left = startOffset * dayWidth;
    geometry.width = qMax(dayWidth * 0.5, duration * dayWidth - BarGutter);
    return geometry;
}

int daysForPixelDelta(double pixelDelta, double dayWidth)
{
    if (dayWidth <= 0.0) {
        return 0;
    }
    return qRound(pixelDelta / dayWidth);
}

QDate dateAtPosition(double x, const QDate &origin, double dayWidth)
{
    if (dayWidth <= 0.0 || !origin.isValid()) {
        return {};
    }
    return origin.addDays(static_cast<qint64>(std::floor(x / dayWidth)));
}

QDate earliestStartDate(const data::TaskList &tasks)
{
    QDate earliest;
    for (const auto &task : tasks) {
        if (task->startDate.isValid() && (!earliest.isValid() || task->startDate < earliest)) {
            earliest = task->startDate;
        }
        const QDate nested = earliestStartDate(task->children);
        if (nested.isValid() && (!earliest.isValid() || nested < earliest)) {
            earliest = nested;
        }
    }
    return earliest;
}

TimelineRange timelineRangeFor(ViewMode mode, const QDate &anchor, const QDate &today)
{
    TimelineRange range;
    switch (mode) {
    case ViewMode::Week:
        range.start = startOfWeek(today);
        range.end = range.start.addDays(WeekModeSpanDays);
        range.baseDayWidth = WeekModeDayWidth;
        break;
    case ViewMode::Month:
        range.start = startOfMonth(today);
        range.end = endOfMonth(range.start.addDays(MonthModeLookaheadDays));
        range.baseDayWidth = MonthModeDayWidth;
        break;
    case ViewMode::Day:
        range.start = anchor.isValid() ? anchor : today;
        range.end = range.start.addDays(DayModeSpanDays);
        range.baseDayWidth = DayModeDayWidth;
        break;
    }
    return range;
}

} // namespace core
} // namespace gantt
