#pragma once

#include <QString>
#include <QStringList>
#include <chrono>

#include "timeslot/core/GridConfig.hpp"

class QSettings;

namespace timeslot {
namespace core {

// Application settings stored under the "timeslot/" group.
struct TimeslotSettings
{
    GridConfig grid;
    QString timeFormat = QStringLiteral("%I:%M %p");
    std::chrono::minutes defaultOccasionDuration = std::chrono::hours(1);
    Qt::DayOfWeek firstWeekday = Qt::Sunday;
    QStringList knownEventTypes;

    // Missing keys keep their defaults. Throws InvalidConfigError when the
    // stored grid values are unusable.
    static TimeslotSettings load(const QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace timeslot
