#pragma once

#include <QObject>
#include <cstddef>

#include "gantt/core/GanttAction.hpp"
#include "gantt/core/GanttState.hpp"

namespace gantt {
namespace core {

// Owns the single GanttState. dispatch() is the only way to change it;
// collaborators read through state() and listen to stateChanged().
class GanttStore : public QObject
{
    Q_OBJECT

public:
    explicit GanttStore(GanttState initialState = GanttState(), QObject *parent = nullptr);

    const GanttState &state() const;
    void dispatch(const Action &action);
    std::size_t dispatchCount() const;

signals:
    void stateChanged(const gantt::core::GanttState &state);

private:
    GanttState m_state;
    std::size_t m_dispatchCount = 0;
};

} // namespace core
} // namespace gantt
