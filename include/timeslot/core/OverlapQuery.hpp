#pragma once

#include <QDateTime>
#include <QUuid>
#include <optional>
#include <vector>

#include "timeslot/data/Occasion.hpp"

namespace timeslot {
namespace core {

// Closed-interval overlap: touching bounds count.
bool intervalsOverlap(const QDateTime &aStart, const QDateTime &aEnd,
                      const QDateTime &bStart, const QDateTime &bEnd);

// Occasions intersecting [windowStart, windowEnd], ordered by start then end.
std::vector<data::Occasion> overlapping(const std::vector<data::Occasion> &occasions,
                                        const QDateTime &windowStart,
                                        const QDateTime &windowEnd,
                                        const std::optional<QUuid> &owner = std::nullopt);

// Occasions touching the calendar day of reference (00:00:00 to 23:59:59).
std::vector<data::Occasion> dailyOccasions(const std::vector<data::Occasion> &occasions,
                                           const QDateTime &reference = QDateTime::currentDateTime(),
                                           const std::optional<QUuid> &owner = std::nullopt);

QDateTime startOfDay(const QDate &day);
QDateTime endOfDay(const QDate &day);

} // namespace core
} // namespace timeslot
