#include "gantt/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcGanttStore, "gantt.store")
Q_LOGGING_CATEGORY(lcGanttInteraction, "gantt.interaction")
Q_LOGGING_CATEGORY(lcGanttUi, "gantt.ui")
