#pragma once

#include <QString>
#include <QVector>

#include "gantt/data/Task.hpp"

namespace gantt {
namespace core {

enum class InsertPosition
{
    Above,
    Below,
    Subtask,
};

struct VisibleRow
{
    data::TaskPtr task;
    int level = 0;
};

// All functions below are pure: the input forest is never modified and the
// result shares every subtree that was not on the path to the edited node.
// Ids are unique across the forest; a depth-first pre-order search stops at
// the first match.

data::TaskPtr findTask(const data::TaskList &tasks, const QString &id);

data::TaskList updateTask(const data::TaskList &tasks, const QString &id, const data::TaskUpdate &update);

data::TaskList insertTask(const data::TaskList &tasks,
                          data::Task newTask,
                          InsertPosition position,
                          const QString &targetId);

data::TaskList deleteTask(const data::TaskList &tasks, const QString &id);

// Detaches the task and re-inserts it under newParentId (empty for root) at
// index, interpreted after removal and clamped. Returns the input unchanged
// when the task or parent is missing or the parent lies inside the subtree.
data::TaskList moveTask(const data::TaskList &tasks,
                        const QString &id,
                        const QString &newParentId,
                        int index);

// Structural parent of id, or null for roots and unknown ids.
data::TaskPtr parentOf(const data::TaskList &tasks, const QString &id);
bool isDescendantOf(const data::TaskList &tasks, const QString &id, const QString &ancestorId);
int rootIndexOf(const data::TaskList &tasks, const QString &id);
int countTasks(const data::TaskList &tasks);
int subtreeSize(const data::TaskPtr &task);

// Pre-order rows of the forest; children are listed only below expanded parents.
QVector<VisibleRow> visibleRows(const data::TaskList &tasks);

} // namespace core
} // namespace gantt
