#pragma once

#include <QDate>
#include <optional>
#include <vector>

#include "timeslot/data/Occasion.hpp"

namespace timeslot {
namespace data {

class OccasionRepository
{
public:
    virtual ~OccasionRepository() = default;

    // Occasions overlapping the day, ordered by start then end.
    virtual std::vector<Occasion> loadOccasionsForDay(const QDate &day,
                                                      const std::optional<QUuid> &owner = std::nullopt) const = 0;
    virtual std::vector<Occasion> fetchOccasions(const QUuid &eventId) const = 0;
    virtual Occasion saveOccasion(Occasion occasion) = 0;
    // Stores a batch in one write.
    virtual std::vector<Occasion> saveOccasions(std::vector<Occasion> occasions) = 0;
    virtual int removeOccasions(const QUuid &eventId) = 0;
};

} // namespace data
} // namespace timeslot
