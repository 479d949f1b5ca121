#pragma once

#include <QDate>
#include <QString>
#include <optional>

#include "gantt/core/GanttState.hpp"
#include "gantt/core/TaskTree.hpp"
#include "gantt/data/Task.hpp"

namespace gantt {
namespace core {

enum class ActionType
{
    SetTasks,
    AddTask,
    AddTaskAtPosition,
    UpdateTask,
    DeleteTask,
    SelectTask,
    ToggleTaskExpansion,
    SetViewMode,
    ToggleMaximize,
    SetZoomLevel,
    StartDrag,
    EndDrag,
    ReorderTasks,
    MoveTaskToParent,
    StartResize,
    EndResize,
    ResizeTask,
};

// A single state transition request. Only the fields relevant to type are
// read by the reducer; use the named constructors below.
struct Action
{
    ActionType type = ActionType::SetTasks;
    QString taskId;
    data::TaskList tasks;
    data::Task task;
    data::TaskPtr draggedTask;
    InsertPosition position = InsertPosition::Below;
    data::TaskUpdate updates;
    ViewMode viewMode = ViewMode::Day;
    double zoomLevel = DefaultZoomLevel;
    int sourceIndex = -1;
    int destinationIndex = -1;
    QString newParentId;
    int newIndex = 0;
    ResizeHandle handle = ResizeHandle::None;
    std::optional<QDate> newStartDate;
    std::optional<QDate> newEndDate;

    static Action setTasks(data::TaskList tasks);
    static Action addTask(data::Task task);
    static Action addTaskAtPosition(data::Task task, InsertPosition position, const QString &targetTaskId);
    static Action updateTask(const QString &id, data::TaskUpdate updates);
    static Action deleteTask(const QString &id);
    static Action selectTask(const QString &id);
    static Action clearSelection();
    static Action toggleTaskExpansion(const QString &id);
    static Action setViewMode(ViewMode mode);
    static Action toggleMaximize();
    static Action setZoomLevel(double zoomLevel);
    static Action startDrag(data::TaskPtr task);
    static Action endDrag();
    static Action reorderTasks(int sourceIndex, int destinationIndex);
    static Action moveTaskToParent(const QString &id, const QString &newParentId, int newIndex);
    static Action startResize(const QString &id, ResizeHandle handle);
    static Action endResize();
    static Action resizeTask(const QString &id, std::optional<QDate> newStartDate, std::optional<QDate> newEndDate);
};

const char *actionTypeName(ActionType type);

} // namespace core
} // namespace gantt
