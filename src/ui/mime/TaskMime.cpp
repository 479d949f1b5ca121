#include "gantt/ui/mime/TaskMime.hpp"

#include <QBuffer>
#include <QDataStream>

namespace gantt {
namespace ui {

namespace {
constexpr quint32 CurrentTaskMimeVersion = 1;
}

QByteArray encodeTaskMime(const QStringList &taskIds)
{
    QByteArray buffer;
    QDataStream stream(&buffer, QIODevice::WriteOnly);
    stream << TaskMimeMagic << CurrentTaskMimeVersion << quint32(taskIds.size());
    for (const auto &id : taskIds) {
        stream << id;
    }
    return buffer;
}

QStringList decodeTaskMime(const QByteArray &payload)
{
    QStringList ids;
    if (payload.isEmpty()) {
        return ids;
    }
    QBuffer buffer(const_cast<QByteArray *>(&payload));
    buffer.open(QIODevice::ReadOnly);
    QDataStream stream(&buffer);

    quint32 magic = 0;
    quint32 version = 0;
    quint32 count = 0;
    stream >> magic;
    if (magic != TaskMimeMagic) {
        return ids;
    }
    stream >> version >> count;
    for (quint32 i = 0; i < count && !stream.atEnd(); ++i) {
        QString id;
        stream >> id;
        if (!id.isEmpty()) {
            ids << id;
        }
    }
    return ids;
}

} // namespace ui
} // namespace gantt
