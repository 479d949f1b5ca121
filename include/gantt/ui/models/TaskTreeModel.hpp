#pragma once

#include <QAbstractItemModel>
#include <QHash>
#include <QString>

#include "gantt/data/Task.hpp"

namespace gantt {
namespace ui {

// Shared by the table and the chart so their rows line up.
constexpr int TaskRowHeight = 40;

class TaskTreeModel : public QAbstractItemModel
{
    Q_OBJECT

public:
    enum Column
    {
        NameColumn,
        StartColumn,
        EndColumn,
        DurationColumn,
        ProgressColumn,
        ResourcesColumn,
        DependenciesColumn,
        ColumnCount
    };

    enum Role
    {
        TaskIdRole = Qt::UserRole + 1,
        SortRole,
        StatusRole,
        PriorityRole,
    };

    explicit TaskTreeModel(QObject *parent = nullptr);

    QModelIndex index(int row, int column, const QModelIndex &parent = QModelIndex()) const override;
    QModelIndex parent(const QModelIndex &child) const override;
    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;
    QMimeData *mimeData(const QModelIndexList &indexes) const override;
    QStringList mimeTypes() const override;
    Qt::DropActions supportedDropActions() const override;

    void setTasks(data::TaskList tasks);
    const data::TaskList &tasks() const;
    const data::Task *taskAt(const QModelIndex &index) const;
    data::TaskPtr taskForId(const QString &id) const;
    QModelIndex indexForId(const QString &id, int column = NameColumn) const;

private:
    struct NodeInfo
    {
        const data::Task *parent = nullptr;
        int row = 0;
    };

    const data::TaskList &childrenOf(const data::Task *parent) const;
    void indexNodes(const data::TaskList &tasks, const data::Task *parent);

    data::TaskList m_tasks;
    QHash<const data::Task *, NodeInfo> m_nodes;
    QHash<QString, data::TaskPtr> m_byId;
};

} // namespace ui
} // namespace gantt
