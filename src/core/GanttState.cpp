#include "gantt/core/GanttState.hpp"

#include <QtGlobal>

namespace gantt {
namespace core {

bool operator==(const GanttState &lhs, const GanttState &rhs)
{
    return lhs.tasks == rhs.tasks && lhs.selectedTaskId == rhs.selectedTaskId && lhs.viewMode == rhs.viewMode
        && lhs.isMaximized == rhs.isMaximized && qFuzzyCompare(lhs.zoomLevel, rhs.zoomLevel)
        && lhs.draggedTask == rhs.draggedTask && lhs.isResizing == rhs.isResizing
        && lhs.resizeHandle == rhs.resizeHandle && lhs.resizingTaskId == rhs.resizingTaskId;
}

bool operator!=(const GanttState &lhs, const GanttState &rhs)
{
    return !(lhs == rhs);
}

double clampZoomLevel(double zoomLevel)
{
    if (qIsNaN(zoomLevel)) {
        return DefaultZoomLevel;
    }
    return qBound(MinZoomLevel, zoomLevel, MaxZoomLevel);
}

} // namespace core
} // namespace gantt
