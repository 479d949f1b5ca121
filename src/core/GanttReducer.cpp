#include "gantt/core/GanttReducer.hpp"

#include <QtGlobal>

#include "gantt/core/Logging.hpp"
#include "gantt/core/TaskTree.hpp"

namespace gantt {
namespace core {

namespace {

data::TaskList reorderRoots(const data::TaskList &tasks, int sourceIndex, int destinationIndex)
{
    const int count = static_cast<int>(tasks.size());
    if (sourceIndex < 0 || sourceIndex >= count || sourceIndex == destinationIndex) {
        return tasks;
    }
    data::TaskList reordered = tasks;
    data::TaskPtr moved = reordered.takeAt(sourceIndex);
    reordered.insert(qBound(0, destinationIndex, static_cast<int>(reordered.size())), moved);
    return reordered;
}

} // namespace

GanttState reduce(const GanttState &state, const Action &action)
{
    GanttState next = state;
    switch (action.type) {
    case ActionType::SetTasks:
        next.tasks = action.tasks;
        return next;

    case ActionType::AddTask: {
        data::Task root = action.task;
        root.parentId.clear();
        next.tasks.append(data::makeTask(std::move(root)));
        return next;
    }

    case ActionType::AddTaskAtPosition:
        next.tasks = insertTask(state.tasks, action.task, action.position, action.taskId);
        return next;

    case ActionType::UpdateTask:
        next.tasks = updateTask(state.tasks, action.taskId, action.updates);
        return next;

    case ActionType::DeleteTask:
        next.tasks = deleteTask(state.tasks, action.taskId);
        return next;

    case ActionType::SelectTask:
        next.selectedTaskId = action.taskId;
        return next;

    case ActionType::ToggleTaskExpansion: {
        const data::TaskPtr task = findTask(state.tasks, action.taskId);
        if (!task) {
            return state;
        }
        data::TaskUpdate update;
        update.isExpanded = !task->isExpanded;
        next.tasks = updateTask(state.tasks, action.taskId, update);
        return next;
    }

    case ActionType::SetViewMode:
        next.viewMode = action.viewMode;
        return next;

    case ActionType::ToggleMaximize:
        next.isMaximized = !state.isMaximized;
        return next;

    case ActionType::SetZoomLevel:
        next.zoomLevel = clampZoomLevel(action.zoomLevel);
        return next;

    case ActionType::StartDrag:
        next.draggedTask = action.draggedTask;
        return next;

    case ActionType::EndDrag:
        next.draggedTask.reset();
        return next;

    case ActionType::ReorderTasks:
        next.tasks = reorderRoots(state.tasks, action.sourceIndex, action.destinationIndex);
        return next;

    case ActionType::MoveTaskToParent:
        next.tasks = moveTask(state.tasks, action.taskId, action.newParentId, action.newIndex);
        return next;

    case ActionType::StartResize:
        next.isResizing = true;
        next.resizeHandle = action.handle;
        next.resizingTaskId = action.taskId;
        next.selectedTaskId = action.taskId;
        return next;

    case ActionType::EndResize:
        next.isResizing = false;
        next.resizeHandle = ResizeHandle::None;
        next.resizingTaskId.clear();
        return next;

    case ActionType::ResizeTask: {
        data::TaskUpdate update;
        update.startDate = action.newStartDate;
        update.endDate = action.newEndDate;
        if (update.isEmpty()) {
            return state;
        }
        next.tasks = updateTask(state.tasks, action.taskId, update);
        return next;
    }
    }

    qCWarning(lcGanttStore) << "Ignoring unknown action type" << static_cast<int>(action.type);
    return state;
}

} // namespace core
} // namespace gantt
