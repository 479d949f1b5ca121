#pragma once

#include <QDate>
#include <QString>
#include <QStringList>

#include "gantt/data/Task.hpp"

namespace gantt {
namespace core {

// Text-level contents of the task editor.
struct TaskFormData
{
    QString name;
    QString startDate;
    QString endDate;
    int progress = 0;
    QString color = QStringLiteral("#3b82f6");
    QString notes;
    QString priority = QStringLiteral("medium");
    QString status = QStringLiteral("not-started");
    QString resources;
    QString dependencies;
};

TaskFormData formDataForTask(const data::Task &task);
TaskFormData defaultFormData(const QDate &today);

// Comma separated, trimmed, empties dropped.
QStringList splitList(const QString &text);

// Fields that fail to parse are left out of the update.
data::TaskUpdate taskUpdateFromForm(const TaskFormData &form);

data::Task newTaskFromUpdate(const data::TaskUpdate &update, const QString &id, int order, const QDate &today);

QString createTaskId();

} // namespace core
} // namespace gantt
