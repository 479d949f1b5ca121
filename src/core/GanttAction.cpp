#include "gantt/core/GanttAction.hpp"

namespace gantt {
namespace core {

namespace {
Action ofType(ActionType type)
{
    Action action;
    action.type = type;
    return action;
}
} // namespace

Action Action::setTasks(data::TaskList tasks)
{
    Action action = ofType(ActionType::SetTasks);
    action.tasks = std::move(tasks);
    return action;
}

Action Action::addTask(data::Task task)
{
    Action action = ofType(ActionType::AddTask);
    action.task = std::move(task);
    return action;
}

Action Action::addTaskAtPosition(data::Task task, InsertPosition position, const QString &targetTaskId)
{
    Action action = ofType(ActionType::AddTaskAtPosition);
    action.task = std::move(task);
    action.position = position;
    action.taskId = targetTaskId;
    return action;
}

Action Action::updateTask(const QString &id, data::TaskUpdate updates)
{
    Action action = ofType(ActionType::UpdateTask);
    action.taskId = id;
    action.updates = std::move(updates);
    return action;
}

Action Action::deleteTask(const QString &id)
{
    Action action = ofType(ActionType::DeleteTask);
    action.taskId = id;
    return action;
}

Action Action::selectTask(const QString &id)
{
    Action action = ofType(ActionType::SelectTask);
    action.taskId = id;
    return action;
}

Action Action::clearSelection()
{
    return ofType(ActionType::SelectTask);
}

Action Action::toggleTaskExpansion(const QString &id)
{
    Action action = ofType(ActionType::ToggleTaskExpansion);
    action.taskId = id;
    return action;
}

Action Action::setViewMode(ViewMode mode)
{
    Action action = ofType(ActionType::SetViewMode);
    action.viewMode = mode;
    return action;
}

Action Action::toggleMaximize()
{
    return ofType(ActionType::ToggleMaximize);
}

Action Action::setZoomLevel(double zoomLevel)
{
    Action action = ofType(ActionType::SetZoomLevel);
    action.zoomLevel = zoomLevel;
    return action;
}

Action Action::startDrag(data::TaskPtr task)
{
    Action action = ofType(ActionType::StartDrag);
    action.draggedTask = std::move(task);
    return action;
}

Action Action::endDrag()
{
    return ofType(ActionType::EndDrag);
}

Action Action::reorderTasks(int sourceIndex, int destinationIndex)
{
    Action action = ofType(ActionType::ReorderTasks);
    action.sourceIndex = sourceIndex;
    action.destinationIndex = destinationIndex;
    return action;
}

Action Action::moveTaskToParent(const QString &id, const QString &newParentId, int newIndex)
{
    Action action = ofType(ActionType::MoveTaskToParent);
    action.taskId = id;
    action.newParentId = newParentId;
    action.newIndex = newIndex;
    return action;
}

Action Action::startResize(const QString &id, ResizeHandle handle)
{
    Action action = ofType(ActionType::StartResize);
    action.taskId = id;
    action.handle = handle;
    return action;
}

Action Action::endResize()
{
    return ofType(ActionType::EndResize);
}

Action Action::resizeTask(const QString &id, std::optional<QDate> newStartDate, std::optional<QDate> newEndDate)
{
    Action action = ofType(ActionType::ResizeTask);
    action.taskId = id;
    action.newStartDate = std::move(newStartDate);
    action.newEndDate = std::move(newEndDate);
    return action;
}

const char *actionTypeName(ActionType type)
{
    switch (type) {
    case ActionType::SetTasks:
        return "SET_TASKS";
    case ActionType::AddTask:
        return "ADD_TASK";
    case ActionType::AddTaskAtPosition:
        return "ADD_TASK_AT_POSITION";
    case ActionType::UpdateTask:
        return "UPDATE_TASK";
    case ActionType::DeleteTask:
        return "DELETE_TASK";
    case ActionType::SelectTask:
        return "SELECT_TASK";
    case ActionType::ToggleTaskExpansion:
        return "TOGGLE_TASK_EXPANSION";
    case ActionType::SetViewMode:
        return "SET_VIEW_MODE";
    case ActionType::ToggleMaximize:
        return "TOGGLE_MAXIMIZE";
    case ActionType::SetZoomLevel:
        return "SET_ZOOM_LEVEL";
    case ActionType::StartDrag:
        return "START_DRAG";
    case ActionType::EndDrag:
        return "END_DRAG";
    case ActionType::ReorderTasks:
        return "REORDER_TASKS";
    case ActionType::MoveTaskToParent:
        return "MOVE_TASK_TO_PARENT";
    case ActionType::StartResize:
        return "START_RESIZE";
    case ActionType::EndResize:
        return "END_RESIZE";
    case ActionType::ResizeTask:
        return "RESIZE_TASK";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace gantt
