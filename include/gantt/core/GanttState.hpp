#pragma once

#include <QMetaType>
#include <QString>

#include "gantt/data/Task.hpp"

namespace gantt {
namespace core {

enum class ViewMode
{
    Day,
    Week,
    Month,
};

enum class ResizeHandle
{
    None,
    Start,
    End,
};

constexpr double MinZoomLevel = 0.5;
constexpr double MaxZoomLevel = 3.0;
constexpr double DefaultZoomLevel = 1.0;

struct GanttState
{
    data::TaskList tasks;
    QString selectedTaskId; // empty when nothing is selected
    ViewMode viewMode = ViewMode::Day;
    bool isMaximized = false;
    double zoomLevel = DefaultZoomLevel;
    data::TaskPtr draggedTask;
    bool isResizing = false;
    ResizeHandle resizeHandle = ResizeHandle::None;
    QString resizingTaskId;
};

// Cheap comparison: forests compare by node identity, not by value.
bool operator==(const GanttState &lhs, const GanttState &rhs);
bool operator!=(const GanttState &lhs, const GanttState &rhs);

double clampZoomLevel(double zoomLevel);

} // namespace core
} // namespace gantt

Q_DECLARE_METATYPE(gantt::core::GanttState)
