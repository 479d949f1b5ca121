#pragma once

#include <QMainWindow>
#include <memory>

#include "gantt/core/GanttState.hpp"
#include "gantt/core/TaskTree.hpp"

class QAction;
class QComboBox;
class QLabel;
class QLineEdit;
class QSplitter;
class QToolBar;

namespace gantt {
namespace core {
class AppContext;
class GanttStore;
}

namespace ui {

class GanttChartView;
class TaskDetailDialog;
class TaskFilterProxyModel;
class TaskTreeModel;
class TaskTreeView;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

protected:
    void changeEvent(QEvent *event) override;
    void showEvent(QShowEvent *event) override;

private:
    void setupUi();
    QToolBar *createTaskToolBar();
    QToolBar *createViewToolBar();
    QToolBar *createFilterToolBar();
    void connectScrollSync();
    void saveUiState() const;
    void restoreUiState();

    core::GanttStore &store() const;
    void handleStateChanged(const core::GanttState &state);
    void refreshChartRows();
    void updateTimeline(const core::GanttState &state);
    void updateActionStates(const core::GanttState &state);

    void createTask();
    void insertTask(core::InsertPosition position);
    void editSelectedTask();
    void editTask(const QString &taskId);
    void deleteSelectedTask();
    void changeZoom(double delta);
    void setTableVisible(bool visible);
    void showTaskContextMenu(const QPoint &pos);
    void updateFilters();

    std::unique_ptr<core::AppContext> m_appContext;
    std::unique_ptr<TaskTreeModel> m_model;
    std::unique_ptr<TaskFilterProxyModel> m_proxyModel;
    std::unique_ptr<TaskDetailDialog> m_detailDialog;
    TaskTreeView *m_taskView = nullptr;
    GanttChartView *m_chartView = nullptr;
    QSplitter *m_splitter = nullptr;
    QLineEdit *m_searchField = nullptr;
    QComboBox *m_statusFilter = nullptr;
    QComboBox *m_priorityFilter = nullptr;
    QLabel *m_zoomLabel = nullptr;
    QAction *m_editAction = nullptr;
    QAction *m_deleteAction = nullptr;
    QAction *m_insertAboveAction = nullptr;
    QAction *m_insertBelowAction = nullptr;
    QAction *m_addSubtaskAction = nullptr;
    QAction *m_dayAction = nullptr;
    QAction *m_weekAction = nullptr;
    QAction *m_monthAction = nullptr;
    QAction *m_maximizeAction = nullptr;
    QAction *m_tableAction = nullptr;
    bool m_syncingScroll = false;
};

} // namespace ui
} // namespace gantt
