#pragma once

#include <QColor>
#include <QDate>
#include <QString>
#include <optional>

#include "gantt/core/GanttState.hpp"
#include "gantt/data/Task.hpp"

namespace gantt {
namespace core {

QColor statusColor(data::TaskStatus status);
QColor priorityColor(data::TaskPriority priority);

// yyyy-MM-dd
QString formatTaskDate(const QDate &date);
QDate parseTaskDate(const QString &text);

QString statusToString(data::TaskStatus status);
std::optional<data::TaskStatus> statusFromString(const QString &value);
QString statusDisplayName(data::TaskStatus status);

QString priorityToString(data::TaskPriority priority);
std::optional<data::TaskPriority> priorityFromString(const QString &value);
QString priorityDisplayName(data::TaskPriority priority);

// Multi-line hover text: name, dates with duration, progress.
QString taskToolTip(const data::Task &task);

QString viewModeToString(ViewMode mode);
std::optional<ViewMode> viewModeFromString(const QString &value);

} // namespace core
} // namespace gantt
