#pragma once

#include <QDate>
#include <QDateTime>
#include <QTime>
#include <chrono>
#include <vector>

namespace timeslot {
namespace core {

struct GridConfig
{
    QTime startTime = QTime(9, 0);
    std::chrono::minutes spanDuration = std::chrono::hours(8);
    std::chrono::minutes slotInterval = std::chrono::minutes(15);
    int minColumns = 4;

    // Throws InvalidConfigError.
    void validate() const;
    int slotCount() const;

    // Slot times are wall-clock offsets from midnight of the day, so a
    // daylight saving change never shifts them off stored occasion times.
    QDateTime gridStart(const QDate &day) const;
    QDateTime gridEnd(const QDate &day) const;
    std::vector<QDateTime> slotKeys(const QDate &day) const;
};

} // namespace core
} // namespace timeslot
