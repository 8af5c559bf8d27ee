#include "timeslot/core/OverlapQuery.hpp"

#include <algorithm>

namespace timeslot {
namespace core {

bool intervalsOverlap(const QDateTime &aStart, const QDateTime &aEnd,
                      const QDateTime &bStart, const QDateTime &bEnd)
{
    return aStart <= bEnd && aEnd >= bStart;
}

std::vector<data::Occasion> overlapping(const std::vector<data::Occasion> &occasions,
                                        const QDateTime &windowStart,
                                        const QDateTime &windowEnd,
                                        const std::optional<QUuid> &owner)
{
    std::vector<data::Occasion> result;
    for (const auto &occasion : occasions) {
        if (owner && occasion.eventId != *owner) {
            continue;
        }
        if (intervalsOverlap(occasion.start, occasion.end, windowStart, windowEnd)) {
            result.push_back(occasion);
        }
    }
    std::stable_sort(result.begin(), result.end());
    return result;
}

std::vector<data::Occasion> dailyOccasions(const std::vector<data::Occasion> &occasions,
                                           const QDateTime &reference,
                                           const std::optional<QUuid> &owner)
{
    const QDate day = reference.date();
    return overlapping(occasions, startOfDay(day), endOfDay(day), owner);
}

QDateTime startOfDay(const QDate &day)
{
    return QDateTime(day, QTime(0, 0));
}

QDateTime endOfDay(const QDate &day)
{
    return QDateTime(day, QTime(23, 59, 59));
}

} // namespace core
} // namespace timeslot
