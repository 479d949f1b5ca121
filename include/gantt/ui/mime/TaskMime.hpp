#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QtGlobal>

namespace gantt {
namespace ui {

constexpr const char *TaskMimeType = "application/x-gantt-task";
constexpr quint32 TaskMimeMagic = 0x474E5454; // "GNTT"

QByteArray encodeTaskMime(const QStringList &taskIds);
QStringList decodeTaskMime(const QByteArray &payload);

} // namespace ui
} // namespace gantt
