#include "gantt/ui/MainWindow.hpp"

#include <QAction>
#include <QActionGroup>
#include <QComboBox>
#include <QEvent>
#include <QHeaderView>
#include <QKeySequence>
#include <QLabel>
#include <QLineEdit>
#include <QMenu>
#include <QScrollBar>
#include <QSettings>
#include <QSignalBlocker>
#include <QSplitter>
#include <QStatusBar>
#include <QToolBar>
#include <QVBoxLayout>

#include "gantt/core/AppContext.hpp"
#include "gantt/core/GanttStore.hpp"
#include "gantt/core/Logging.hpp"
#include "gantt/core/TaskForm.hpp"
#include "gantt/core/TaskFormatting.hpp"
#include "gantt/core/TimelineGeometry.hpp"
#include "gantt/ui/dialogs/TaskDetailDialog.hpp"
#include "gantt/ui/models/TaskFilterProxyModel.hpp"
#include "gantt/ui/models/TaskTreeModel.hpp"
#include "gantt/ui/widgets/GanttChartView.hpp"
#include "gantt/ui/widgets/TaskTreeView.hpp"

namespace gantt {
namespace ui {

namespace {
constexpr double ZoomStep = 0.2;
}

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_appContext(std::make_unique<core::AppContext>())
    , m_model(std::make_unique<TaskTreeModel>())
    , m_proxyModel(std::make_unique<TaskFilterProxyModel>())
{
    m_proxyModel->setSourceModel(m_model.get());
    setupUi();
    connect(&store(), &core::GanttStore::stateChanged, this, &MainWindow::handleStateChanged);
    restoreUiState();
    handleStateChanged(store().state());
}

MainWindow::~MainWindow()
{
    saveUiState();
}

void MainWindow::changeEvent(QEvent *event)
{
    QMainWindow::changeEvent(event);
    if (event->type() != QEvent::WindowStateChange) {
        return;
    }
    // Keep isMaximized in the store when the window manager changes it.
    if (isMaximized() != store().state().isMaximized) {
        store().dispatch(core::Action::toggleMaximize());
    }
}

void MainWindow::showEvent(QShowEvent *event)
{
    QMainWindow::showEvent(event);
    m_chartView->setHeaderHeight(m_taskView->header()->sizeHint().height());
}

void MainWindow::setupUi()
{
    setWindowTitle(tr("Gantt Planner"));
    resize(1400, 800);

    addToolBar(Qt::TopToolBarArea, createTaskToolBar());
    addToolBar(Qt::TopToolBarArea, createViewToolBar());
    addToolBarBreak(Qt::TopToolBarArea);
    addToolBar(Qt::TopToolBarArea, createFilterToolBar());

    m_taskView = new TaskTreeView(store(), this);
    m_taskView->setFilterModel(m_proxyModel.get());
    m_taskView->setContextMenuPolicy(Qt::CustomContextMenu);
    m_taskView->header()->resizeSection(TaskTreeModel::NameColumn, 220);
    connect(m_taskView, &TaskTreeView::editRequested, this, &MainWindow::editTask);
    connect(m_taskView, &QWidget::customContextMenuRequested, this, &MainWindow::showTaskContextMenu);

    m_chartView = new GanttChartView(store(), this);
    connect(m_chartView, &GanttChartView::editRequested, this, &MainWindow::editTask);
    connect(m_chartView, &GanttChartView::zoomRequested, this, [this](bool zoomIn) {
        changeZoom(zoomIn ? ZoomStep : -ZoomStep);
    });
    // Timeline updates are held back while a bar is dragged.
    connect(m_chartView, &GanttChartView::gestureFinished, this, [this]() { updateTimeline(store().state()); });

    m_splitter = new QSplitter(Qt::Horizontal, this);
    m_splitter->addWidget(m_taskView);
    m_splitter->addWidget(m_chartView);
    m_splitter->setStretchFactor(0, 0);
    m_splitter->setStretchFactor(1, 1);
    m_splitter->setCollapsible(0, true);
    m_splitter->setCollapsible(1, false);
    m_splitter->setSizes({ 560, 840 });

    auto *centralWidget = new QWidget(this);
    auto *layout = new QVBoxLayout(centralWidget);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->addWidget(m_splitter);
    setCentralWidget(centralWidget);

    connectScrollSync();
    connect(m_proxyModel.get(), &QAbstractItemModel::layoutChanged, this, &MainWindow::refreshChartRows);
    connect(m_proxyModel.get(), &QAbstractItemModel::rowsInserted, this, &MainWindow::refreshChartRows);
    connect(m_proxyModel.get(), &QAbstractItemModel::rowsRemoved, this, &MainWindow::refreshChartRows);

    statusBar()->showMessage(tr("Ready"));
}

QToolBar *MainWindow::createTaskToolBar()
{
    auto *toolbar = new QToolBar(tr("Tasks"), this);
    toolbar->setMovable(false);

    auto *newAction = toolbar->addAction(tr("New Task"));
    newAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_N));
    connect(newAction, &QAction::triggered, this, &MainWindow::createTask);

    m_editAction = toolbar->addAction(tr("Edit"));
    m_editAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_E));
    connect(m_editAction, &QAction::triggered, this, &MainWindow::editSelectedTask);

    m_deleteAction = toolbar->addAction(tr("Delete"));
    m_deleteAction->setShortcut(QKeySequence::Delete);
    connect(m_deleteAction, &QAction::triggered, this, &MainWindow::deleteSelectedTask);

    toolbar->addSeparator();

    m_insertAboveAction = toolbar->addAction(tr("Insert Above"));
    connect(m_insertAboveAction, &QAction::triggered, this, [this]() { insertTask(core::InsertPosition::Above); });

    m_insertBelowAction = toolbar->addAction(tr("Insert Below"));
    connect(m_insertBelowAction, &QAction::triggered, this, [this]() { insertTask(core::InsertPosition::Below); });

    m_addSubtaskAction = toolbar->addAction(tr("Add Subtask"));
    m_addSubtaskAction->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_N));
    connect(m_addSubtaskAction, &QAction::triggered, this, [this]() { insertTask(core::InsertPosition::Subtask); });

    return toolbar;
}

QToolBar *MainWindow::createViewToolBar()
{
    auto *toolbar = new QToolBar(tr("View"), this);
    toolbar->setMovable(false);

    auto *modeGroup = new QActionGroup(toolbar);
    const auto addModeAction = [&](const QString &text, core::ViewMode mode) {
        auto *action = toolbar->addAction(text);
        action->setCheckable(true);
        modeGroup->addAction(action);
        connect(action, &QAction::triggered, this, [this, mode]() {
            store().dispatch(core::Action::setViewMode(mode));
        });
        return action;
    };
    m_dayAction = addModeAction(tr("Day"), core::ViewMode::Day);
    m_weekAction = addModeAction(tr("Week"), core::ViewMode::Week);
    m_monthAction = addModeAction(tr("Month"), core::ViewMode::Month);

    toolbar->addSeparator();

    auto *zoomOut = toolbar->addAction(tr("Zoom -"));
    zoomOut->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Minus));
    connect(zoomOut, &QAction::triggered, this, [this]() { changeZoom(-ZoomStep); });

    m_zoomLabel = new QLabel(toolbar);
    m_zoomLabel->setMinimumWidth(48);
    m_zoomLabel->setAlignment(Qt::AlignCenter);
    toolbar->addWidget(m_zoomLabel);

    auto *zoomIn = toolbar->addAction(tr("Zoom +"));
    zoomIn->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Plus));
    connect(zoomIn, &QAction::triggered, this, [this]() { changeZoom(ZoomStep); });

    auto *zoomReset = toolbar->addAction(tr("Reset Zoom"));
    zoomReset->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_0));
    connect(zoomReset, &QAction::triggered, this, [this]() {
        store().dispatch(core::Action::setZoomLevel(core::DefaultZoomLevel));
    });

    toolbar->addSeparator();

    m_tableAction = toolbar->addAction(tr("Show Table"));
    m_tableAction->setCheckable(true);
    m_tableAction->setChecked(true);
    connect(m_tableAction, &QAction::toggled, this, &MainWindow::setTableVisible);

    m_maximizeAction = toolbar->addAction(tr("Maximize"));
    m_maximizeAction->setCheckable(true);
    m_maximizeAction->setShortcut(QKeySequence(Qt::Key_F11));
    connect(m_maximizeAction, &QAction::triggered, this, [this]() {
        store().dispatch(core::Action::toggleMaximize());
    });

    return toolbar;
}

QToolBar *MainWindow::createFilterToolBar()
{
    auto *toolbar = new QToolBar(tr("Filter"), this);
    toolbar->setMovable(false);

    m_searchField = new QLineEdit(toolbar);
    m_searchField->setPlaceholderText(tr("Search tasks…"));
    m_searchField->setClearButtonEnabled(true);
    m_searchField->setMaximumWidth(280);
    connect(m_searchField, &QLineEdit::textChanged, this, &MainWindow::updateFilters);
    toolbar->addWidget(m_searchField);

    m_statusFilter = new QComboBox(toolbar);
    m_statusFilter->addItem(tr("All Status"), QString());
    for (auto status : { data::TaskStatus::NotStarted,
                         data::TaskStatus::InProgress,
                         data::TaskStatus::Completed,
                         data::TaskStatus::OnHold }) {
        m_statusFilter->addItem(core::statusDisplayName(status), core::statusToString(status));
    }
    connect(m_statusFilter, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::updateFilters);
    toolbar->addWidget(m_statusFilter);

    m_priorityFilter = new QComboBox(toolbar);
    m_priorityFilter->addItem(tr("All Priority"), QString());
    for (auto priority : { data::TaskPriority::High, data::TaskPriority::Medium, data::TaskPriority::Low }) {
        m_priorityFilter->addItem(core::priorityDisplayName(priority), core::priorityToString(priority));
    }
    connect(m_priorityFilter, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::updateFilters);
    toolbar->addWidget(m_priorityFilter);

    auto *focusSearch = new QAction(this);
    focusSearch->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_F));
    connect(focusSearch, &QAction::triggered, this, [this]() {
        m_searchField->setFocus(Qt::ShortcutFocusReason);
        m_searchField->selectAll();
    });
    addAction(focusSearch);

    return toolbar;
}

void MainWindow::connectScrollSync()
{
    connect(m_taskView->verticalScrollBar(), &QScrollBar::valueChanged, this, [this](int value) {
        if (m_syncingScroll) {
            return;
        }
        m_syncingScroll = true;
        m_chartView->setVerticalScrollValue(value);
        m_syncingScroll = false;
    });
    connect(m_chartView->verticalScrollBar(), &QScrollBar::valueChanged, this, [this](int value) {
        if (m_syncingScroll) {
            return;
        }
        m_syncingScroll = true;
        auto *vbar = m_taskView->verticalScrollBar();
        vbar->setValue(qBound(vbar->minimum(), value, vbar->maximum()));
        m_syncingScroll = false;
    });
}

void MainWindow::saveUiState() const
{
    QSettings settings;
    const auto &state = store().state();
    settings.setValue(QStringLiteral("chart/viewMode"), core::viewModeToString(state.viewMode));
    settings.setValue(QStringLiteral("chart/zoomLevel"), state.zoomLevel);
    QVariantList sizes;
    for (int size : m_splitter->sizes()) {
        sizes << size;
    }
    settings.setValue(QStringLiteral("ui/splitterSizes"), sizes);
    settings.setValue(QStringLiteral("ui/tableVisible"), m_tableAction->isChecked());
    qCDebug(lcGanttUi) << "Saved settings to" << settings.fileName();
}

void MainWindow::restoreUiState()
{
    QSettings settings;
    if (const auto mode = core::viewModeFromString(settings.value(QStringLiteral("chart/viewMode")).toString())) {
        store().dispatch(core::Action::setViewMode(*mode));
    }
    bool ok = false;
    const double zoom = settings.value(QStringLiteral("chart/zoomLevel")).toDouble(&ok);
    if (ok) {
        store().dispatch(core::Action::setZoomLevel(zoom));
    }

    const auto list = settings.value(QStringLiteral("ui/splitterSizes")).toList();
    if (list.size() == m_splitter->count()) {
        QList<int> sizes;
        for (const auto &entry : list) {
            sizes << entry.toInt();
        }
        m_splitter->setSizes(sizes);
    }
    m_tableAction->setChecked(settings.value(QStringLiteral("ui/tableVisible"), true).toBool());
    qCDebug(lcGanttUi) << "Restored settings from" << settings.fileName();
}

core::GanttStore &MainWindow::store() const
{
    return m_appContext->store();
}

void MainWindow::handleStateChanged(const core::GanttState &state)
{
    if (state.tasks != m_model->tasks()) {
        const int scroll = m_chartView->verticalScrollValue();
        m_model->setTasks(state.tasks);
        m_taskView->syncFromState();
        refreshChartRows();
        m_chartView->setVerticalScrollValue(scroll);
    } else {
        m_taskView->syncFromState();
    }

    m_chartView->setSelectedTaskId(state.selectedTaskId);
    m_chartView->setZoomLevel(state.zoomLevel);
    if (!m_chartView->isInteracting()) {
        updateTimeline(state);
    }
    m_zoomLabel->setText(QStringLiteral("%1%").arg(qRound(state.zoomLevel * 100)));
    updateActionStates(state);

    if (state.isMaximized != isMaximized()) {
        if (state.isMaximized) {
            showMaximized();
        } else {
            showNormal();
        }
    }
}

void MainWindow::refreshChartRows()
{
    m_chartView->setRows(m_proxyModel->displayedRows());
}

void MainWindow::updateTimeline(const core::GanttState &state)
{
    const QDate today = QDate::currentDate();
    const QDate anchor = core::earliestStartDate(state.tasks);
    m_chartView->setTimeline(core::timelineRangeFor(state.viewMode, anchor, today), state.viewMode);
}

void MainWindow::updateActionStates(const core::GanttState &state)
{
    const bool hasSelection = core::findTask(state.tasks, state.selectedTaskId) != nullptr;
    m_editAction->setEnabled(hasSelection);
    m_deleteAction->setEnabled(hasSelection);
    m_insertAboveAction->setEnabled(hasSelection);
    m_insertBelowAction->setEnabled(hasSelection);
    m_addSubtaskAction->setEnabled(hasSelection);

    const QSignalBlocker dayBlocker(m_dayAction);
    const QSignalBlocker weekBlocker(m_weekAction);
    const QSignalBlocker monthBlocker(m_monthAction);
    const QSignalBlocker maximizeBlocker(m_maximizeAction);
    m_dayAction->setChecked(state.viewMode == core::ViewMode::Day);
    m_weekAction->setChecked(state.viewMode == core::ViewMode::Week);
    m_monthAction->setChecked(state.viewMode == core::ViewMode::Month);
    m_maximizeAction->setChecked(state.isMaximized);
}

void MainWindow::createTask()
{
    if (!m_detailDialog) {
        m_detailDialog = std::make_unique<TaskDetailDialog>(this);
    }
    const QDate today = QDate::currentDate();
    m_detailDialog->setWindowTitle(tr("New Task"));
    m_detailDialog->setFormData(core::defaultFormData(today));
    if (m_detailDialog->exec() != QDialog::Accepted) {
        return;
    }
    const auto update = core::taskUpdateFromForm(m_detailDialog->formData());
    const int order = static_cast<int>(store().state().tasks.size()) + 1;
    auto task = core::newTaskFromUpdate(update, core::createTaskId(), order, today);
    const QString id = task.id;
    store().dispatch(core::Action::addTask(std::move(task)));
    store().dispatch(core::Action::selectTask(id));
    statusBar()->showMessage(tr("Task created"), 1500);
}

void MainWindow::insertTask(core::InsertPosition position)
{
    const QString targetId = store().state().selectedTaskId;
    const auto target = core::findTask(store().state().tasks, targetId);
    if (!target) {
        createTask();
        return;
    }
    if (!m_detailDialog) {
        m_detailDialog = std::make_unique<TaskDetailDialog>(this);
    }
    const QDate today = QDate::currentDate();
    m_detailDialog->setWindowTitle(position == core::InsertPosition::Subtask ? tr("New Subtask") : tr("New Task"));
    m_detailDialog->setFormData(core::defaultFormData(today));
    if (m_detailDialog->exec() != QDialog::Accepted) {
        return;
    }
    const auto update = core::taskUpdateFromForm(m_detailDialog->formData());
    const int order = position == core::InsertPosition::Subtask ? static_cast<int>(target->children.size()) + 1
                                                                 : target->order;
    auto task = core::newTaskFromUpdate(update, core::createTaskId(), order, today);
    const QString id = task.id;
    store().dispatch(core::Action::addTaskAtPosition(std::move(task), position, targetId));
    store().dispatch(core::Action::selectTask(id));
    statusBar()->showMessage(tr("Task inserted"), 1500);
}

void MainWindow::editSelectedTask()
{
    editTask(store().state().selectedTaskId);
}

void MainWindow::editTask(const QString &taskId)
{
    const auto task = core::findTask(store().state().tasks, taskId);
    if (!task) {
        return;
    }
    if (store().state().selectedTaskId != taskId) {
        store().dispatch(core::Action::selectTask(taskId));
    }
    if (!m_detailDialog) {
        m_detailDialog = std::make_unique<TaskDetailDialog>(this);
    }
    m_detailDialog->setWindowTitle(tr("Edit Task"));
    m_detailDialog->setFormData(core::formDataForTask(*task));
    if (m_detailDialog->exec() != QDialog::Accepted) {
        return;
    }
    store().dispatch(core::Action::updateTask(taskId, core::taskUpdateFromForm(m_detailDialog->formData())));
    statusBar()->showMessage(tr("Task updated"), 1500);
}

void MainWindow::deleteSelectedTask()
{
    const QString id = store().state().selectedTaskId;
    if (!core::findTask(store().state().tasks, id)) {
        return;
    }
    store().dispatch(core::Action::deleteTask(id));
    store().dispatch(core::Action::clearSelection());
    statusBar()->showMessage(tr("Task deleted"), 1500);
}

void MainWindow::changeZoom(double delta)
{
    store().dispatch(core::Action::setZoomLevel(store().state().zoomLevel + delta));
}

void MainWindow::setTableVisible(bool visible)
{
    m_taskView->setVisible(visible);
}

void MainWindow::showTaskContextMenu(const QPoint &pos)
{
    const QString id = m_proxyModel->taskIdAt(m_taskView->indexAt(pos));
    if (!id.isEmpty() && id != store().state().selectedTaskId) {
        store().dispatch(core::Action::selectTask(id));
    }
    QMenu menu(this);
    menu.addAction(m_editAction);
    menu.addSeparator();
    menu.addAction(m_insertAboveAction);
    menu.addAction(m_insertBelowAction);
    menu.addAction(m_addSubtaskAction);
    menu.addSeparator();
    menu.addAction(m_deleteAction);
    menu.exec(m_taskView->viewport()->mapToGlobal(pos));
}

void MainWindow::updateFilters()
{
    m_proxyModel->setFilterText(m_searchField->text().trimmed());
    m_proxyModel->setStatusFilter(core::statusFromString(m_statusFilter->currentData().toString()));
    m_proxyModel->setPriorityFilter(core::priorityFromString(m_priorityFilter->currentData().toString()));
    m_taskView->syncFromState();
    refreshChartRows();
    qCDebug(lcGanttUi) << "Filters" << m_searchField->text() << m_statusFilter->currentData().toString()
                       << m_priorityFilter->currentData().toString();
}

} // namespace ui
} // namespace gantt
