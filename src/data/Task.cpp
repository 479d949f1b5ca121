#include "gantt/data/Task.hpp"

namespace gantt {
namespace data {

bool TaskUpdate::isEmpty() const
{
    return !name && !startDate && !endDate && !progress && !color && !order && !isExpanded && !dependencies
        && !resources && !notes && !priority && !status;
}

void TaskUpdate::applyTo(Task &task) const
{
    if (name) {
        task.name = *name;
    }
    if (startDate) {
        task.startDate = *startDate;
    }
    if (endDate) {
        task.endDate = *endDate;
    }
    if (progress) {
        task.progress = *progress;
    }
    if (color) {
        task.color = *color;
    }
    if (order) {
        task.order = *order;
    }
    if (isExpanded) {
        task.isExpanded = *isExpanded;
    }
    if (dependencies) {
        task.dependencies = *dependencies;
    }
    if (resources) {
        task.resources = *resources;
    }
    if (notes) {
        task.notes = *notes;
    }
    if (priority) {
        task.priority = *priority;
    }
    if (status) {
        task.status = *status;
    }
}

TaskPtr makeTask(Task task)
{
    return std::make_shared<const Task>(std::move(task));
}

} // namespace data
} // namespace gantt
