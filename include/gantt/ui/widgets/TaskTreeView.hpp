#pragma once

#include <QString>
#include <QTreeView>

#include "gantt/core/ReorderSession.hpp"

namespace gantt {
namespace core {
class GanttStore;
}

namespace ui {

class TaskFilterProxyModel;

// Task table. Root rows are reordered by drag and drop; expanding,
// collapsing and clicking rows is forwarded to the store.
class TaskTreeView : public QTreeView
{
    Q_OBJECT

public:
    explicit TaskTreeView(core::GanttStore &store, QWidget *parent = nullptr);

    void setFilterModel(TaskFilterProxyModel *model);
    TaskFilterProxyModel *filterModel() const;

    // Brings the view in line with the isExpanded flags and the selection
    // held by the store without dispatching anything back.
    void syncFromState();

signals:
    void editRequested(const QString &taskId);

protected:
    void startDrag(Qt::DropActions supportedActions) override;
    void dragEnterEvent(QDragEnterEvent *event) override;
    void dragMoveEvent(QDragMoveEvent *event) override;
    void dropEvent(QDropEvent *event) override;
    void dragLeaveEvent(QDragLeaveEvent *event) override;
    void paintEvent(QPaintEvent *event) override;

private:
    bool acceptTaskMime(const QMimeData *mime) const;
    void updateDropTarget(const QPoint &pos);
    void clearDropTarget();
    void handleExpansion(const QModelIndex &index, bool expanded);
    void handleClicked(const QModelIndex &index);
    void syncExpansion(const QModelIndex &parent);

    core::GanttStore &m_store;
    core::ReorderSession m_reorder;
    TaskFilterProxyModel *m_filterModel = nullptr;
    QString m_dropTargetId;
    bool m_syncing = false;
};

} // namespace ui
} // namespace gantt
