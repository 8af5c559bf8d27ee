#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>
#include <utility>
#include <vector>

#include "timeslot/core/GridConfig.hpp"

namespace timeslot {
namespace core {

// strftime-style time label. Supports %H %I %M %S %p and %%; any other
// directive is copied through unchanged.
QString formatTime(const QTime &time, const QString &format);

struct TimeslotOption
{
    QDateTime value;
    QString label;
};

// Start/end choices for time selectors: one entry per slot key of the grid.
std::vector<TimeslotOption> timeslotOptions(const QDate &day, const GridConfig &config, const QString &format);

// First and last date of the month containing date.
std::pair<QDate, QDate> monthBoundaries(const QDate &date);

} // namespace core
} // namespace timeslot
