#include "timeslot/data/InMemoryOccasionRepository.hpp"

#include "timeslot/core/OverlapQuery.hpp"

#include <algorithm>

namespace timeslot {
namespace data {

InMemoryOccasionRepository::InMemoryOccasionRepository() = default;
InMemoryOccasionRepository::~InMemoryOccasionRepository() = default;

std::vector<Occasion> InMemoryOccasionRepository::loadOccasionsForDay(const QDate &day,
                                                                      const std::optional<QUuid> &owner) const
{
    const std::vector<Occasion> all(m_occasions.cbegin(), m_occasions.cend());
    return core::dailyOccasions(all, core::startOfDay(day), owner);
}

std::vector<Occasion> InMemoryOccasionRepository::fetchOccasions(const QUuid &eventId) const
{
    std::vector<Occasion> result;
    for (const auto &occasion : m_occasions) {
        if (occasion.eventId == eventId) {
            result.push_back(occasion);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

Occasion InMemoryOccasionRepository::saveOccasion(Occasion occasion)
{
    if (occasion.id.isNull()) {
        occasion.id = QUuid::createUuid();
    }
    m_occasions.insert(occasion.id, occasion);
    return occasion;
}

std::vector<Occasion> InMemoryOccasionRepository::saveOccasions(std::vector<Occasion> occasions)
{
    for (auto &occasion : occasions) {
        occasion = saveOccasion(std::move(occasion));
    }
    return occasions;
}

int InMemoryOccasionRepository::removeOccasions(const QUuid &eventId)
{
    int removed = 0;
    for (auto it = m_occasions.begin(); it != m_occasions.end();) {
        if (it->eventId == eventId) {
            it = m_occasions.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace data
} // namespace timeslot
