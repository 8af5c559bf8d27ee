#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcGrid)
Q_DECLARE_LOGGING_CATEGORY(lcRecurrence)
Q_DECLARE_LOGGING_CATEGORY(lcStorage)
