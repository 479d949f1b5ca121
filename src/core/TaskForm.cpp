#include "gantt/core/TaskForm.hpp"

#include <QColor>
#include <QObject>
#include <QUuid>
#include <QtGlobal>

#include "gantt/core/TaskFormatting.hpp"

namespace gantt {
namespace core {

namespace {
const char *DefaultTaskColor = "#3b82f6";
}

TaskFormData formDataForTask(const data::Task &task)
{
    TaskFormData form;
    form.name = task.name;
    form.startDate = formatTaskDate(task.startDate);
    form.endDate = formatTaskDate(task.endDate);
    form.progress = task.progress;
    form.color = task.color.isValid() ? task.color.name() : QString::fromLatin1(DefaultTaskColor);
    form.notes = task.notes;
    form.priority = priorityToString(task.priority);
    form.status = statusToString(task.status);
    form.resources = task.resources.join(QStringLiteral(", "));
    form.dependencies = task.dependencies.join(QStringLiteral(", "));
    return form;
}

TaskFormData defaultFormData(const QDate &today)
{
    TaskFormData form;
    form.startDate = formatTaskDate(today);
    form.endDate = formatTaskDate(today);
    return form;
}

QStringList splitList(const QString &text)
{
    QStringList result;
    const QStringList parts = text.split(QLatin1Char(','));
    for (const QString &part : parts) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            result << trimmed;
        }
    }
    return result;
}

data::TaskUpdate taskUpdateFromForm(const TaskFormData &form)
{
    data::TaskUpdate update;
    update.name = form.name.trimmed();

    const QDate start = parseTaskDate(form.startDate);
    const QDate end = parseTaskDate(form.endDate);
    if (start.isValid()) {
        update.startDate = start;
    }
    if (end.isValid()) {
        update.endDate = (start.isValid() && end < start) ? start : end;
    }

    update.progress = qBound(0, form.progress, 100);

    const QColor color(form.color.trimmed());
    if (color.isValid()) {
        update.color = color;
    }
    update.notes = form.notes;

    if (auto priority = priorityFromString(form.priority)) {
        update.priority = *priority;
    }
    if (auto status = statusFromString(form.status)) {
        update.status = *status;
    }
    update.resources = splitList(form.resources);
    update.dependencies = splitList(form.dependencies);
    return update;
}

data::Task newTaskFromUpdate(const data::TaskUpdate &update, const QString &id, int order, const QDate &today)
{
    data::Task task;
    task.id = id;
    task.name = QObject::tr("New Task");
    task.startDate = today;
    task.endDate = today.addDays(1);
    task.progress = 0;
    task.color = QColor(QString::fromLatin1(DefaultTaskColor));
    task.order = order;
    task.priority = data::TaskPriority::Medium;
    task.status = data::TaskStatus::NotStarted;

    update.applyTo(task);
    if (task.name.isEmpty()) {
        task.name = QObject::tr("New Task");
    }
    if (task.endDate < task.startDate) {
        task.endDate = task.startDate;
    }
    return task;
}

QString createTaskId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

} // namespace core
} // namespace gantt
