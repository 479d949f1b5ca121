#include "gantt/ui/models/TaskFilterProxyModel.hpp"

#include "gantt/ui/models/TaskTreeModel.hpp"

namespace gantt {
namespace ui {

TaskFilterProxyModel::TaskFilterProxyModel(QObject *parent)
    : QSortFilterProxyModel(parent)
{
    setFilterCaseSensitivity(Qt::CaseInsensitive);
    setSortCaseSensitivity(Qt::CaseInsensitive);
    setSortRole(TaskTreeModel::SortRole);
}

void TaskFilterProxyModel::setFilterText(const QString &text)
{
    if (m_filterText == text) {
        return;
    }
    m_filterText = text;
    invalidateFilter();
}

void TaskFilterProxyModel::setStatusFilter(std::optional<data::TaskStatus> status)
{
    if (m_statusFilter == status) {
        return;
    }
    m_statusFilter = status;
    invalidateFilter();
}

void TaskFilterProxyModel::setPriorityFilter(std::optional<data::TaskPriority> priority)
{
    if (m_priorityFilter == priority) {
        return;
    }
    m_priorityFilter = priority;
    invalidateFilter();
}

QString TaskFilterProxyModel::taskIdAt(const QModelIndex &index) const
{
    if (!index.isValid()) {
        return {};
    }
    return index.data(TaskTreeModel::TaskIdRole).toString();
}

QString TaskFilterProxyModel::rootIdAt(const QModelIndex &index) const
{
    if (!index.isValid()) {
        return {};
    }
    auto root = index.sibling(index.row(), TaskTreeModel::NameColumn);
    while (root.parent().isValid()) {
        root = root.parent();
    }
    return taskIdAt(root);
}

QStringList TaskFilterProxyModel::displayedRootIds() const
{
    QStringList ids;
    const int count = rowCount();
    for (int row = 0; row < count; ++row) {
        ids << taskIdAt(index(row, TaskTreeModel::NameColumn));
    }
    return ids;
}

QVector<core::VisibleRow> TaskFilterProxyModel::displayedRows() const
{
    QVector<core::VisibleRow> rows;
    collectRows(QModelIndex(), 0, rows);
    return rows;
}

bool TaskFilterProxyModel::filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const
{
    if (sourceParent.isValid()) {
        return true;
    }
    auto *model = taskModel();
    if (!model) {
        return true;
    }
    const auto *task = model->taskAt(model->index(sourceRow, TaskTreeModel::NameColumn, sourceParent));
    if (!task) {
        return true;
    }

    if (!m_filterText.isEmpty() && !task->name.contains(m_filterText, Qt::CaseInsensitive)) {
        return false;
    }

    if (m_statusFilter.has_value() && task->status != m_statusFilter.value()) {
        return false;
    }

    if (m_priorityFilter.has_value() && task->priority != m_priorityFilter.value()) {
        return false;
    }

    return true;
}

TaskTreeModel *TaskFilterProxyModel::taskModel() const
{
    return qobject_cast<TaskTreeModel *>(sourceModel());
}

void TaskFilterProxyModel::collectRows(const QModelIndex &parent, int level, QVector<core::VisibleRow> &rows) const
{
    auto *model = taskModel();
    if (!model) {
        return;
    }
    const int count = rowCount(parent);
    for (int row = 0; row < count; ++row) {
        const auto proxyIndex = index(row, TaskTreeModel::NameColumn, parent);
        auto task = model->taskForId(taskIdAt(proxyIndex));
        if (!task) {
            continue;
        }
        const bool descend = task->isExpanded && task->hasChildren();
        rows.append(core::VisibleRow{ std::move(task), level });
        if (descend) {
            collectRows(proxyIndex, level + 1, rows);
        }
    }
}

} // namespace ui
} // namespace gantt
