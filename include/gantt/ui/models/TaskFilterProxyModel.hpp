#pragma once

#include <QSortFilterProxyModel>
#include <QStringList>
#include <QVector>
#include <optional>

#include "gantt/core/TaskTree.hpp"
#include "gantt/data/Task.hpp"

namespace gantt {
namespace ui {

class TaskTreeModel;

// Filters root rows only; an accepted root keeps its whole subtree.
class TaskFilterProxyModel : public QSortFilterProxyModel
{
    Q_OBJECT

public:
    explicit TaskFilterProxyModel(QObject *parent = nullptr);

    void setFilterText(const QString &text);
    void setStatusFilter(std::optional<data::TaskStatus> status);
    void setPriorityFilter(std::optional<data::TaskPriority> priority);

    QString taskIdAt(const QModelIndex &index) const;
    QString rootIdAt(const QModelIndex &index) const;

    // Root ids in display order.
    QStringList displayedRootIds() const;

    // Rows in display order, descending into tasks whose isExpanded is set.
    QVector<core::VisibleRow> displayedRows() const;

protected:
    bool filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const override;

private:
    TaskTreeModel *taskModel() const;
    void collectRows(const QModelIndex &parent, int level, QVector<core::VisibleRow> &rows) const;

    QString m_filterText;
    std::optional<data::TaskStatus> m_statusFilter;
    std::optional<data::TaskPriority> m_priorityFilter;
};

} // namespace ui
} // namespace gantt
