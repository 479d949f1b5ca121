#pragma once

#include <memory>

namespace gantt {
namespace core {

class GanttStore;

class AppContext
{
public:
    AppContext();
    ~AppContext();

    GanttStore &store();

private:
    std::unique_ptr<GanttStore> m_store;
};

} // namespace core
} // namespace gantt
