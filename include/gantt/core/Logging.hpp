#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcGanttStore)
Q_DECLARE_LOGGING_CATEGORY(lcGanttInteraction)
Q_DECLARE_LOGGING_CATEGORY(lcGanttUi)
