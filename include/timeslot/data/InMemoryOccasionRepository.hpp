#pragma once

#include <QHash>

#include "timeslot/data/OccasionRepository.hpp"

namespace timeslot {
namespace data {

class InMemoryOccasionRepository : public OccasionRepository
{
public:
    InMemoryOccasionRepository();
    ~InMemoryOccasionRepository() override;

    std::vector<Occasion> loadOccasionsForDay(const QDate &day,
                                              const std::optional<QUuid> &owner = std::nullopt) const override;
    std::vector<Occasion> fetchOccasions(const QUuid &eventId) const override;
    Occasion saveOccasion(Occasion occasion) override;
    std::vector<Occasion> saveOccasions(std::vector<Occasion> occasions) override;
    int removeOccasions(const QUuid &eventId) override;

private:
    QHash<QUuid, Occasion> m_occasions;
};

} // namespace data
} // namespace timeslot
