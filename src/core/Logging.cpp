#include "timeslot/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcGrid, "timeslot.grid")
Q_LOGGING_CATEGORY(lcRecurrence, "timeslot.recurrence")
Q_LOGGING_CATEGORY(lcStorage, "timeslot.storage")
