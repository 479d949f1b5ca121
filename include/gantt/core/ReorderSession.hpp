#pragma once

#include <QString>
#include <QStringList>
#include <optional>
#include <utility>

#include "gantt/data/Task.hpp"

namespace gantt {
namespace core {

class GanttStore;

// Reorders root rows. The rows a user sees may be filtered or sorted, so the
// dragged and target rows are resolved by id against the full root list
// before REORDER_TASKS is dispatched.
class ReorderSession
{
public:
    explicit ReorderSession(GanttStore &store);

    bool begin(const QStringList &displayedRootIds, const QString &taskId);
    bool drop(const QString &overId);
    void cancel();

    bool isActive() const;
    const QString &taskId() const;

    static std::optional<std::pair<int, int>> resolveIndices(const data::TaskList &roots,
                                                             const QString &activeId,
                                                             const QString &overId);

private:
    void finish();

    GanttStore &m_store;
    QStringList m_displayedIds;
    QString m_taskId;
    bool m_active = false;
};

} // namespace core
} // namespace gantt
