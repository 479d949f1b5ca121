#pragma once

#include <QColor>
#include <QDate>
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>
#include <optional>

namespace gantt {
namespace data {

enum class TaskPriority
{
    Low,
    Medium,
    High,
};

enum class TaskStatus
{
    NotStarted,
    InProgress,
    Completed,
    OnHold,
};

struct Task;

// Nodes are immutable once published; edits rebuild the path to the root.
using TaskPtr = std::shared_ptr<const Task>;
using TaskList = QVector<TaskPtr>;

struct Task
{
    QString id;
    QString name;
    QDate startDate;
    QDate endDate;
    int progress = 0;
    QColor color;
    int order = 0;
    QString parentId; // empty for roots
    TaskList children;
    bool isExpanded = false;
    QStringList dependencies;
    QStringList resources;
    QString notes;
    TaskPriority priority = TaskPriority::Medium;
    TaskStatus status = TaskStatus::NotStarted;

    bool hasChildren() const { return !children.isEmpty(); }
};

struct TaskUpdate
{
    std::optional<QString> name;
    std::optional<QDate> startDate;
    std::optional<QDate> endDate;
    std::optional<int> progress;
    std::optional<QColor> color;
    std::optional<int> order;
    std::optional<bool> isExpanded;
    std::optional<QStringList> dependencies;
    std::optional<QStringList> resources;
    std::optional<QString> notes;
    std::optional<TaskPriority> priority;
    std::optional<TaskStatus> status;

    bool isEmpty() const;
    void applyTo(Task &task) const;
};

TaskPtr makeTask(Task task);

} // namespace data
} // namespace gantt
