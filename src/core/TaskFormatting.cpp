#include "gantt/core/TaskFormatting.hpp"

#include <QObject>

#include "gantt/core/TimelineGeometry.hpp"

namespace gantt {
namespace core {

namespace {
const QString DateFormat = QStringLiteral("yyyy-MM-dd");
}

QColor statusColor(data::TaskStatus status)
{
    switch (status) {
    case data::TaskStatus::Completed:
        return QColor(QStringLiteral("#22c55e"));
    case data::TaskStatus::InProgress:
        return QColor(QStringLiteral("#3b82f6"));
    case data::TaskStatus::OnHold:
        return QColor(QStringLiteral("#f59e0b"));
    case data::TaskStatus::NotStarted:
        break;
    }
    return QColor(QStringLiteral("#6b7280"));
}

QColor priorityColor(data::TaskPriority priority)
{
    switch (priority) {
    case data::TaskPriority::High:
        return QColor(QStringLiteral("#ef4444"));
    case data::TaskPriority::Medium:
        return QColor(QStringLiteral("#f59e0b"));
    case data::TaskPriority::Low:
        return QColor(QStringLiteral("#22c55e"));
    }
    return QColor(QStringLiteral("#6b7280"));
}

QString formatTaskDate(const QDate &date)
{
    return date.toString(DateFormat);
}

QDate parseTaskDate(const QString &text)
{
    return QDate::fromString(text.trimmed(), DateFormat);
}

QString statusToString(data::TaskStatus status)
{
    switch (status) {
    case data::TaskStatus::NotStarted:
        return QStringLiteral("not-started");
    case data::TaskStatus::InProgress:
        return QStringLiteral("in-progress");
    case data::TaskStatus::Completed:
        return QStringLiteral("completed");
    case data::TaskStatus::OnHold:
        return QStringLiteral("on-hold");
    }
    return QStringLiteral("not-started");
}

std::optional<data::TaskStatus> statusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QStringLiteral("not-started")) {
        return data::TaskStatus::NotStarted;
    }
    if (normalized == QStringLiteral("in-progress")) {
        return data::TaskStatus::InProgress;
    }
    if (normalized == QStringLiteral("completed")) {
        return data::TaskStatus::Completed;
    }
    if (normalized == QStringLiteral("on-hold")) {
        return data::TaskStatus::OnHold;
    }
    return std::nullopt;
}

QString statusDisplayName(data::TaskStatus status)
{
    switch (status) {
    case data::TaskStatus::NotStarted:
        return QObject::tr("Not Started");
    case data::TaskStatus::InProgress:
        return QObject::tr("In Progress");
    case data::TaskStatus::Completed:
        return QObject::tr("Completed");
    case data::TaskStatus::OnHold:
        return QObject::tr("On Hold");
    }
    return {};
}

QString priorityToString(data::TaskPriority priority)
{
    switch (priority) {
    case data::TaskPriority::Low:
        return QStringLiteral("low");
    case data::TaskPriority::Medium:
        return QStringLiteral("medium");
    case data::TaskPriority::High:
        return QStringLiteral("high");
    }
    return QStringLiteral("medium");
}

std::optional<data::TaskPriority> priorityFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QStringLiteral("low")) {
        return data::TaskPriority::Low;
    }
    if (normalized == QStringLiteral("medium")) {
        return data::TaskPriority::Medium;
    }
    if (normalized == QStringLiteral("high")) {
        return data::TaskPriority::High;
    }
    return std::nullopt;
}

QString priorityDisplayName(data::TaskPriority priority)
{
    switch (priority) {
    case data::TaskPriority::Low:
        return QObject::tr("Low");
    case data::TaskPriority::Medium:
        return QObject::tr("Medium");
    case data::TaskPriority::High:
        return QObject::tr("High");
    }
    return {};
}

QString taskToolTip(const data::Task &task)
{
    return QObject::tr("%1\n%2 - %3 (%4 days)\n%5% complete")
        .arg(task.name,
             formatTaskDate(task.startDate),
             formatTaskDate(task.endDate),
             QString::number(taskDuration(task.startDate, task.endDate)),
             QString::number(task.progress));
}

QString viewModeToString(ViewMode mode)
{
    switch (mode) {
    case ViewMode::Day:
        return QStringLiteral("day");
    case ViewMode::Week:
        return QStringLiteral("week");
    case ViewMode::Month:
        return QStringLiteral("month");
    }
    return QStringLiteral("day");
}

std::optional<ViewMode> viewModeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QStringLiteral("day")) {
        return ViewMode::Day;
    }
    if (normalized == QStringLiteral("week")) {
        return ViewMode::Week;
    }
    if (normalized == QStringLiteral("month")) {
        return ViewMode::Month;
    }
    return std::nullopt;
}

} // namespace core
} // namespace gantt
