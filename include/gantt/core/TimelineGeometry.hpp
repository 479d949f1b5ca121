#pragma once

#include <QDate>

#include "gantt/core/GanttState.hpp"
#include "gantt/data/Task.hpp"

namespace gantt {
namespace core {

// Horizontal inset between adjacent bars, in pixels.
constexpr double BarGutter = 4.0;

struct TaskBarGeometry
{
    double left = 0.0;
    double width = 0.0;
};

struct TimelineRange
{
    QDate start;
    QDate end;
    double baseDayWidth = 0.0;

    int dayCount() const;
};

int daysBetween(const QDate &from, const QDate &to);

// Inclusive of both endpoints; never less than one day.
int taskDuration(const QDate &start, const QDate &end);

double effectiveDayWidth(double baseDayWidth, double zoomLevel);

TaskBarGeometry taskPosition(const data::Task &task, const QDate &origin, double dayWidth);

// Rounded, so sub-day jitter does not swallow a full-day shift.
int daysForPixelDelta(double pixelDelta, double dayWidth);

QDate dateAtPosition(double x, const QDate &origin, double dayWidth);

// Earliest start date anywhere in the forest; invalid for an empty forest.
QDate earliestStartDate(const data::TaskList &tasks);

// Visible date span and day width for a view mode. Day mode starts at anchor;
// week and month modes are aligned to today.
TimelineRange timelineRangeFor(ViewMode mode, const QDate &anchor, const QDate &today);

} // namespace core
} // namespace gantt
