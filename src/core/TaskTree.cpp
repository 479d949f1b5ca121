#include "gantt/core/TaskTree.hpp"

#include <QtGlobal>
#include <functional>

namespace gantt {
namespace core {

using data::Task;
using data::TaskList;
using data::TaskPtr;

namespace {

using NodeTransform = std::function<TaskPtr(const Task &)>;
using SiblingEdit = std::function<void(TaskList &siblings, int index, const QString &parentId)>;

TaskPtr withChildren(const Task &task, TaskList children)
{
    Task copy = task;
    copy.children = std::move(children);
    return data::makeTask(std::move(copy));
}

// Replaces the first node matching id by transform(node) and rebuilds its ancestors.
bool replaceNode(const TaskList &tasks, const QString &id, const NodeTransform &transform, TaskList &result)
{
    for (int i = 0; i < tasks.size(); ++i) {
        const TaskPtr &task = tasks.at(i);
        if (task->id == id) {
            result = tasks;
            result[i] = transform(*task);
            return true;
        }
        if (!task->hasChildren()) {
            continue;
        }
        TaskList children;
        if (replaceNode(task->children, id, transform, children)) {
            result = tasks;
            result[i] = withChildren(*task, std::move(children));
            return true;
        }
    }
    return false;
}

// Runs edit on the sibling list that holds id; parentId names the list's owner.
bool editSiblings(const TaskList &tasks,
                  const QString &parentId,
                  const QString &id,
                  const SiblingEdit &edit,
                  TaskList &result)
{
    for (int i = 0; i < tasks.size(); ++i) {
        const TaskPtr &task = tasks.at(i);
        if (task->id == id) {
            result = tasks;
            edit(result, i, parentId);
            return true;
        }
        if (!task->hasChildren()) {
            continue;
        }
        TaskList children;
        if (editSiblings(task->children, task->id, id, edit, children)) {
            result = tasks;
            result[i] = withChildren(*task, std::move(children));
            return true;
        }
    }
    return false;
}

bool pruneList(const TaskList &tasks, const QString &id, TaskList &result)
{
    bool changed = false;
    TaskList kept;
    kept.reserve(tasks.size());
    for (const TaskPtr &task : tasks) {
        if (task->id == id) {
            changed = true;
            continue;
        }
        if (task->hasChildren()) {
            TaskList children;
            if (pruneList(task->children, id, children)) {
                kept.append(withChildren(*task, std::move(children)));
                changed = true;
                continue;
            }
        }
        kept.append(task);
    }
    if (changed) {
        result = std::move(kept);
    }
    return changed;
}

TaskPtr findParent(const TaskList &tasks, const TaskPtr &parent, const QString &id)
{
    for (const TaskPtr &task : tasks) {
        if (task->id == id) {
            return parent;
        }
        if (task->hasChildren()) {
            if (auto found = findParent(task->children, task, id)) {
                return found;
            }
        }
    }
    return nullptr;
}

void collectVisible(const TaskList &tasks, int level, QVector<VisibleRow> &rows)
{
    for (const TaskPtr &task : tasks) {
        rows.append(VisibleRow{ task, level });
        if (task->isExpanded && task->hasChildren()) {
            collectVisible(task->children, level + 1, rows);
        }
    }
}

} // namespace

TaskPtr findTask(const TaskList &tasks, const QString &id)
{
    for (const TaskPtr &task : tasks) {
        if (task->id == id) {
            return task;
        }
        if (task->hasChildren()) {
            if (auto found = findTask(task->children, id)) {
                return found;
            }
        }
    }
    return nullptr;
}

TaskList updateTask(const TaskList &tasks, const QString &id, const data::TaskUpdate &update)
{
    TaskList result;
    const bool found = replaceNode(tasks, id, [&update](const Task &task) {
        Task merged = task;
        update.applyTo(merged);
        return data::makeTask(std::move(merged));
    }, result);
    return found ? result : tasks;
}

TaskList insertTask(const TaskList &tasks, Task newTask, InsertPosition position, const QString &targetId)
{
    TaskList result;
    bool found = false;
    if (position == InsertPosition::Subtask) {
        found = replaceNode(tasks, targetId, [&newTask, &targetId](const Task &target) {
            Task child = newTask;
            child.parentId = targetId;
            Task parent = target;
            parent.children.append(data::makeTask(std::move(child)));
            parent.isExpanded = true;
            return data::makeTask(std::move(parent));
        }, result);
    } else {
        const int offset = position == InsertPosition::Below ? 1 : 0;
        found = editSiblings(tasks, QString(), targetId, [&newTask, offset](TaskList &siblings, int index, const QString &parentId) {
            Task sibling = newTask;
            sibling.parentId = parentId;
            siblings.insert(index + offset, data::makeTask(std::move(sibling)));
        }, result);
    }
    return found ? result : tasks;
}

TaskList deleteTask(const TaskList &tasks, const QString &id)
{
    TaskList result;
    return pruneList(tasks, id, result) ? result : tasks;
}

TaskList moveTask(const TaskList &tasks, const QString &id, const QString &newParentId, int index)
{
    const TaskPtr task = findTask(tasks, id);
    if (!task) {
        return tasks;
    }
    if (!newParentId.isEmpty()) {
        if (newParentId == id || !findTask(tasks, newParentId) || isDescendantOf(tasks, newParentId, id)) {
            return tasks;
        }
    }

    Task moved = *task;
    moved.parentId = newParentId;
    TaskPtr movedPtr = data::makeTask(std::move(moved));
    TaskList detached = deleteTask(tasks, id);

    if (newParentId.isEmpty()) {
        detached.insert(qBound(0, index, static_cast<int>(detached.size())), movedPtr);
        return detached;
    }

    TaskList result;
    replaceNode(detached, newParentId, [&movedPtr, index](const Task &parent) {
        Task copy = parent;
        copy.children.insert(qBound(0, index, static_cast<int>(copy.children.size())), movedPtr);
        return data::makeTask(std::move(copy));
    }, result);
    return result;
}

TaskPtr parentOf(const TaskList &tasks, const QString &id)
{
    return findParent(tasks, nullptr, id);
}

bool isDescendantOf(const TaskList &tasks, const QString &id, const QString &ancestorId)
{
    const TaskPtr ancestor = findTask(tasks, ancestorId);
    if (!ancestor) {
        return false;
    }
    return findTask(ancestor->children, id) != nullptr;
}

int rootIndexOf(const TaskList &tasks, const QString &id)
{
    for (int i = 0; i < tasks.size(); ++i) {
        if (tasks.at(i)->id == id) {
            return i;
        }
    }
    return -1;
}

int countTasks(const TaskList &tasks)
{
    int count = 0;
    for (const TaskPtr &task : tasks) {
        count += subtreeSize(task);
    }
    return count;
}

int subtreeSize(const TaskPtr &task)
{
    if (!task) {
        return 0;
    }
    return 1 + countTasks(task->children);
}

QVector<VisibleRow> visibleRows(const TaskList &tasks)
{
    QVector<VisibleRow> rows;
    collectVisible(tasks, 0, rows);
    return rows;
}

} // namespace core
} // namespace gantt
