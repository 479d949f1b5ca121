#include "gantt/data/DemoData.hpp"

#include <QObject>

namespace gantt {
namespace data {

namespace {

Task demoTask(const QString &id,
              const QString &name,
              const QDate &start,
              const QDate &end,
              int progress,
              const char *color,
              int order,
              TaskPriority priority,
              TaskStatus status)
{
    Task task;
    task.id = id;
    task.name = name;
    task.startDate = start;
    task.endDate = end;
    task.progress = progress;
    task.color = QColor(QString::fromLatin1(color));
    task.order = order;
    task.priority = priority;
    task.status = status;
    return task;
}

TaskPtr withChildren(Task parent, QVector<Task> children)
{
    int order = 0;
    for (auto &child : children) {
        child.parentId = parent.id;
        child.order = order++;
        parent.children.append(makeTask(std::move(child)));
    }
    return makeTask(std::move(parent));
}

} // namespace

TaskList createDemoTasks()
{
    TaskList tasks;

    Task planning = demoTask(QStringLiteral("1"),
                             QObject::tr("Project Planning"),
                             QDate(2025, 7, 13),
                             QDate(2025, 8, 10),
                             25,
                             "#6366f1",
                             0,
                             TaskPriority::High,
                             TaskStatus::InProgress);
    planning.isExpanded = true;
    tasks.append(withChildren(std::move(planning),
                              {
                                  demoTask(QStringLiteral("2"),
                                           QObject::tr("Requirements Analysis"),
                                           QDate(2025, 7, 15),
                                           QDate(2025, 7, 22),
                                           100,
                                           "#22c55e",
                                           0,
                                           TaskPriority::High,
                                           TaskStatus::Completed),
                                  demoTask(QStringLiteral("3"),
                                           QObject::tr("System Design"),
                                           QDate(2025, 7, 23),
                                           QDate(2025, 7, 30),
                                           75,
                                           "#3b82f6",
                                           1,
                                           TaskPriority::High,
                                           TaskStatus::InProgress),
                                  demoTask(QStringLiteral("4"),
                                           QObject::tr("UI/UX Design"),
                                           QDate(2025, 8, 1),
                                           QDate(2025, 8, 8),
                                           50,
                                           "#a855f7",
                                           2,
                                           TaskPriority::Medium,
                                           TaskStatus::InProgress),
                              }));

    tasks.append(makeTask(demoTask(QStringLiteral("5"),
                                   QObject::tr("Project Milestone"),
                                   QDate(2025, 8, 9),
                                   QDate(2025, 8, 9),
                                   0,
                                   "#000000",
                                   1,
                                   TaskPriority::High,
                                   TaskStatus::NotStarted)));

    Task development = demoTask(QStringLiteral("6"),
                                QObject::tr("Development Phase"),
                                QDate(2025, 7, 14),
                                QDate(2025, 8, 20),
                                30,
                                "#ef4444",
                                2,
                                TaskPriority::High,
                                TaskStatus::InProgress);
    development.isExpanded = false;
    tasks.append(withChildren(std::move(development),
                              {
                                  demoTask(QStringLiteral("7"),
                                           QObject::tr("Backend Development"),
                                           QDate(2025, 7, 17),
                                           QDate(2025, 8, 15),
                                           45,
                                           "#f59e0b",
                                           0,
                                           TaskPriority::High,
                                           TaskStatus::InProgress),
                                  demoTask(QStringLiteral("8"),
                                           QObject::tr("Frontend Development"),
                                           QDate(2025, 7, 20),
                                           QDate(2025, 8, 18),
                                           20,
                                           "#06b6d4",
                                           1,
                                           TaskPriority::High,
                                           TaskStatus::InProgress),
                              }));

    return tasks;
}

} // namespace data
} // namespace gantt
