#include "gantt/ui/models/TaskTreeModel.hpp"

#include <QMimeData>
#include <QSize>

#include "gantt/core/TaskFormatting.hpp"
#include "gantt/core/TimelineGeometry.hpp"
#include "gantt/ui/mime/TaskMime.hpp"

namespace gantt {
namespace ui {

TaskTreeModel::TaskTreeModel(QObject *parent)
    : QAbstractItemModel(parent)
{
}

QModelIndex TaskTreeModel::index(int row, int column, const QModelIndex &parent) const
{
    if (column < 0 || column >= ColumnCount || row < 0) {
        return {};
    }
    if (parent.isValid() && parent.column() != NameColumn) {
        return {};
    }
    const auto &children = childrenOf(taskAt(parent));
    if (row >= children.size()) {
        return {};
    }
    return createIndex(row, column, const_cast<data::Task *>(children.at(row).get()));
}

QModelIndex TaskTreeModel::parent(const QModelIndex &child) const
{
    const auto *task = taskAt(child);
    if (!task) {
        return {};
    }
    const auto it = m_nodes.constFind(task);
    if (it == m_nodes.constEnd() || !it->parent) {
        return {};
    }
    const auto parentIt = m_nodes.constFind(it->parent);
    if (parentIt == m_nodes.constEnd()) {
        return {};
    }
    return createIndex(parentIt->row, NameColumn, const_cast<data::Task *>(it->parent));
}

int TaskTreeModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid() && parent.column() != NameColumn) {
        return 0;
    }
    return static_cast<int>(childrenOf(taskAt(parent)).size());
}

int TaskTreeModel::columnCount(const QModelIndex &parent) const
{
    Q_UNUSED(parent);
    return ColumnCount;
}

QVariant TaskTreeModel::data(const QModelIndex &index, int role) const
{
    const auto *task = taskAt(index);
    if (!task) {
        return {};
    }

    const int duration = core::taskDuration(task->startDate, task->endDate);
    switch (role) {
    case Qt::DisplayRole:
        switch (index.column()) {
        case NameColumn:
            return task->name;
        case StartColumn:
            return core::formatTaskDate(task->startDate);
        case EndColumn:
            return core::formatTaskDate(task->endDate);
        case DurationColumn:
            return tr("%1d").arg(duration);
        case ProgressColumn:
            return tr("%1%").arg(task->progress);
        case ResourcesColumn:
            return task->resources.join(QStringLiteral(", "));
        case DependenciesColumn:
            return task->dependencies.join(QStringLiteral(", "));
        default:
            return {};
        }
    case Qt::ToolTipRole: {
        QString tooltip = tr("%1 • %2 priority")
                              .arg(core::statusDisplayName(task->status), core::priorityDisplayName(task->priority));
        if (!task->notes.isEmpty()) {
            tooltip += QStringLiteral("\n") + task->notes;
        }
        return tooltip;
    }
    case Qt::DecorationRole:
        if (index.column() == NameColumn && task->color.isValid()) {
            return task->color;
        }
        return {};
    case Qt::SizeHintRole:
        return QSize(-1, TaskRowHeight);
    case TaskIdRole:
        return task->id;
    case StatusRole:
        return core::statusToString(task->status);
    case PriorityRole:
        return core::priorityToString(task->priority);
    case SortRole:
        switch (index.column()) {
        case NameColumn:
            return task->name.toLower();
        case StartColumn:
            return task->startDate;
        case EndColumn:
            return task->endDate;
        case DurationColumn:
            return duration;
        case ProgressColumn:
            return task->progress;
        case ResourcesColumn:
            return task->resources.join(QStringLiteral(", ")).toLower();
        case DependenciesColumn:
            return task->dependencies.join(QStringLiteral(", ")).toLower();
        default:
            return {};
        }
    default:
        return {};
    }
}

QVariant TaskTreeModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (orientation != Qt::Horizontal || role != Qt::DisplayRole) {
        return QAbstractItemModel::headerData(section, orientation, role);
    }
    switch (section) {
    case NameColumn:
        return tr("Task Name");
    case StartColumn:
        return tr("Start Date");
    case EndColumn:
        return tr("End Date");
    case DurationColumn:
        return tr("Duration");
    case ProgressColumn:
        return tr("Progress");
    case ResourcesColumn:
        return tr("Resources");
    case DependenciesColumn:
        return tr("Dependencies");
    default:
        return {};
    }
}

Qt::ItemFlags TaskTreeModel::flags(const QModelIndex &index) const
{
    auto defaultFlags = QAbstractItemModel::flags(index);
    const auto *task = taskAt(index);
    if (!task) {
        return defaultFlags;
    }
    defaultFlags |= Qt::ItemIsSelectable | Qt::ItemIsEnabled;
    const auto it = m_nodes.constFind(task);
    if (it != m_nodes.constEnd() && !it->parent) {
        defaultFlags |= Qt::ItemIsDragEnabled | Qt::ItemIsDropEnabled;
    }
    return defaultFlags;
}

QMimeData *TaskTreeModel::mimeData(const QModelIndexList &indexes) const
{
    auto *mime = new QMimeData();
    QStringList ids;
    for (const auto &index : indexes) {
        const auto *task = taskAt(index);
        if (!task || ids.contains(task->id)) {
            continue;
        }
        ids << task->id;
    }
    mime->setData(QString::fromLatin1(TaskMimeType), encodeTaskMime(ids));
    return mime;
}

QStringList TaskTreeModel::mimeTypes() const
{
    return { QString::fromLatin1(TaskMimeType) };
}

Qt::DropActions TaskTreeModel::supportedDropActions() const
{
    return Qt::MoveAction;
}

void TaskTreeModel::setTasks(data::TaskList tasks)
{
    beginResetModel();
    m_tasks = std::move(tasks);
    m_nodes.clear();
    m_byId.clear();
    indexNodes(m_tasks, nullptr);
    endResetModel();
}

const data::TaskList &TaskTreeModel::tasks() const
{
    return m_tasks;
}

const data::Task *TaskTreeModel::taskAt(const QModelIndex &index) const
{
    if (!index.isValid() || index.model() != this) {
        return nullptr;
    }
    return static_cast<const data::Task *>(index.internalPointer());
}

data::TaskPtr TaskTreeModel::taskForId(const QString &id) const
{
    return m_byId.value(id);
}

QModelIndex TaskTreeModel::indexForId(const QString &id, int column) const
{
    const auto *task = m_byId.value(id).get();
    if (!task) {
        return {};
    }
    const auto it = m_nodes.constFind(task);
    if (it == m_nodes.constEnd()) {
        return {};
    }
    return createIndex(it->row, column, const_cast<data::Task *>(task));
}

const data::TaskList &TaskTreeModel::childrenOf(const data::Task *parent) const
{
    return parent ? parent->children : m_tasks;
}

void TaskTreeModel::indexNodes(const data::TaskList &tasks, const data::Task *parent)
{
    for (int row = 0; row < tasks.size(); ++row) {
        const auto &ptr = tasks.at(row);
        const data::Task *task = ptr.get();
        m_nodes.insert(task, NodeInfo{ parent, row });
        m_byId.insert(task->id, ptr);
        if (task->hasChildren()) {
            indexNodes(task->children, task);
        }
    }
}

} // namespace ui
} // namespace gantt
