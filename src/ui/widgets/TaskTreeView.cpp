#include "gantt/ui/widgets/TaskTreeView.hpp"

#include <QDrag>
#include <QDragEnterEvent>
#include <QDragLeaveEvent>
#include <QDragMoveEvent>
#include <QDropEvent>
#include <QHeaderView>
#include <QItemSelectionModel>
#include <QMimeData>
#include <QPainter>

#include "gantt/core/GanttStore.hpp"
#include "gantt/core/Logging.hpp"
#include "gantt/core/TaskTree.hpp"
#include "gantt/ui/mime/TaskMime.hpp"
#include "gantt/ui/models/TaskFilterProxyModel.hpp"
#include "gantt/ui/models/TaskTreeModel.hpp"

namespace gantt {
namespace ui {

TaskTreeView::TaskTreeView(core::GanttStore &store, QWidget *parent)
    : QTreeView(parent)
    , m_store(store)
    , m_reorder(store)
{
    setDragEnabled(true);
    setAcceptDrops(true);
    setDropIndicatorShown(false);
    setDragDropMode(QAbstractItemView::DragDrop);
    setDefaultDropAction(Qt::MoveAction);
    setSelectionMode(QAbstractItemView::SingleSelection);
    setSelectionBehavior(QAbstractItemView::SelectRows);
    setUniformRowHeights(true);
    setAlternatingRowColors(true);
    setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    setVerticalScrollMode(QAbstractItemView::ScrollPerPixel);
    // Store order until the user clicks a header.
    header()->setSortIndicator(-1, Qt::AscendingOrder);
    setSortingEnabled(true);
    header()->setStretchLastSection(true);

    connect(this, &QTreeView::expanded, this, [this](const QModelIndex &index) {
        handleExpansion(index, true);
    });
    connect(this, &QTreeView::collapsed, this, [this](const QModelIndex &index) {
        handleExpansion(index, false);
    });
    connect(this, &QAbstractItemView::clicked, this, &TaskTreeView::handleClicked);
    connect(this, &QAbstractItemView::doubleClicked, this, [this](const QModelIndex &index) {
        if (!m_filterModel) {
            return;
        }
        const QString id = m_filterModel->taskIdAt(index);
        if (!id.isEmpty()) {
            emit editRequested(id);
        }
    });
}

void TaskTreeView::setFilterModel(TaskFilterProxyModel *model)
{
    m_filterModel = model;
    setModel(model);
}

TaskFilterProxyModel *TaskTreeView::filterModel() const
{
    return m_filterModel;
}

void TaskTreeView::syncFromState()
{
    if (!m_filterModel) {
        return;
    }
    m_syncing = true;
    syncExpansion(QModelIndex());

    const QString &selectedId = m_store.state().selectedTaskId;
    auto *selection = selectionModel();
    if (selection) {
        const QString currentId = m_filterModel->taskIdAt(selection->currentIndex());
        if (currentId != selectedId) {
            auto *source = qobject_cast<TaskTreeModel *>(m_filterModel->sourceModel());
            const QModelIndex target = source ? m_filterModel->mapFromSource(source->indexForId(selectedId))
                                              : QModelIndex();
            if (target.isValid()) {
                selection->setCurrentIndex(target,
                                           QItemSelectionModel::ClearAndSelect | QItemSelectionModel::Rows);
            } else {
                selection->clearSelection();
            }
        }
    }
    m_syncing = false;
}

void TaskTreeView::startDrag(Qt::DropActions supportedActions)
{
    Q_UNUSED(supportedActions);
    if (!m_filterModel) {
        return;
    }
    const QModelIndex index = currentIndex();
    if (!index.isValid() || index.parent().isValid()) {
        return;
    }
    const QString id = m_filterModel->taskIdAt(index);
    if (!m_reorder.begin(m_filterModel->displayedRootIds(), id)) {
        return;
    }

    QMimeData *mime = m_filterModel->mimeData(QModelIndexList{ index });
    if (!mime) {
        m_reorder.cancel();
        return;
    }
    auto *drag = new QDrag(this);
    drag->setMimeData(mime);
    drag->exec(Qt::MoveAction);

    // Dropped outside the table or aborted with Escape.
    if (m_reorder.isActive()) {
        m_reorder.cancel();
    }
    clearDropTarget();
}

void TaskTreeView::dragEnterEvent(QDragEnterEvent *event)
{
    if (acceptTaskMime(event->mimeData())) {
        updateDropTarget(event->pos());
        event->acceptProposedAction();
        return;
    }
    clearDropTarget();
    QTreeView::dragEnterEvent(event);
}

void TaskTreeView::dragMoveEvent(QDragMoveEvent *event)
{
    if (acceptTaskMime(event->mimeData())) {
        updateDropTarget(event->pos());
        event->acceptProposedAction();
        return;
    }
    clearDropTarget();
    QTreeView::dragMoveEvent(event);
}

void TaskTreeView::dropEvent(QDropEvent *event)
{
    if (!acceptTaskMime(event->mimeData())) {
        QTreeView::dropEvent(event);
        return;
    }
    const QStringList ids = decodeTaskMime(event->mimeData()->data(QString::fromLatin1(TaskMimeType)));
    if (m_reorder.isActive() && ids.contains(m_reorder.taskId()) && m_filterModel) {
        const QString overId = m_filterModel->rootIdAt(indexAt(event->pos()));
        if (!m_reorder.drop(overId)) {
            qCDebug(lcGanttUi) << "Drop ignored on" << overId;
        }
    }
    event->acceptProposedAction();
    clearDropTarget();
}

void TaskTreeView::dragLeaveEvent(QDragLeaveEvent *event)
{
    clearDropTarget();
    QTreeView::dragLeaveEvent(event);
}

void TaskTreeView::paintEvent(QPaintEvent *event)
{
    QTreeView::paintEvent(event);
    if (m_dropTargetId.isEmpty() || !m_filterModel) {
        return;
    }
    auto *source = qobject_cast<TaskTreeModel *>(m_filterModel->sourceModel());
    if (!source) {
        return;
    }
    const QModelIndex target = m_filterModel->mapFromSource(source->indexForId(m_dropTargetId));
    if (!target.isValid()) {
        return;
    }
    QRect rowRect = visualRect(target);
    rowRect.setLeft(0);
    rowRect.setRight(viewport()->width() - 1);

    QPainter painter(viewport());
    painter.setRenderHint(QPainter::Antialiasing);
    QColor fill = palette().highlight().color();
    fill.setAlpha(60);
    painter.setBrush(fill);
    painter.setPen(QPen(palette().highlight().color(), 2));
    painter.drawRoundedRect(QRectF(rowRect).adjusted(1, 1, -1, -1), 4, 4);
}

bool TaskTreeView::acceptTaskMime(const QMimeData *mime) const
{
    return mime && mime->hasFormat(QString::fromLatin1(TaskMimeType));
}

void TaskTreeView::updateDropTarget(const QPoint &pos)
{
    const QString id = m_filterModel ? m_filterModel->rootIdAt(indexAt(pos)) : QString();
    if (id == m_dropTargetId) {
        return;
    }
    m_dropTargetId = id;
    viewport()->update();
}

void TaskTreeView::clearDropTarget()
{
    if (m_dropTargetId.isEmpty()) {
        return;
    }
    m_dropTargetId.clear();
    viewport()->update();
}

void TaskTreeView::handleExpansion(const QModelIndex &index, bool expanded)
{
    if (m_syncing || !m_filterModel) {
        return;
    }
    const QString id = m_filterModel->taskIdAt(index);
    const auto task = core::findTask(m_store.state().tasks, id);
    if (!task || task->isExpanded == expanded) {
        return;
    }
    m_store.dispatch(core::Action::toggleTaskExpansion(id));
}

void TaskTreeView::handleClicked(const QModelIndex &index)
{
    if (!m_filterModel) {
        return;
    }
    const QString id = m_filterModel->taskIdAt(index.sibling(index.row(), TaskTreeModel::NameColumn));
    if (id.isEmpty() || id == m_store.state().selectedTaskId) {
        return;
    }
    m_store.dispatch(core::Action::selectTask(id));
}

void TaskTreeView::syncExpansion(const QModelIndex &parent)
{
    auto *source = qobject_cast<TaskTreeModel *>(m_filterModel->sourceModel());
    if (!source) {
        return;
    }
    const int count = m_filterModel->rowCount(parent);
    for (int row = 0; row < count; ++row) {
        const QModelIndex index = m_filterModel->index(row, TaskTreeModel::NameColumn, parent);
        const auto task = source->taskForId(m_filterModel->taskIdAt(index));
        if (!task || !task->hasChildren()) {
            continue;
        }
        setExpanded(index, task->isExpanded);
        if (task->isExpanded) {
            syncExpansion(index);
        }
    }
}

} // namespace ui
} // namespace gantt
