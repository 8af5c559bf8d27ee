#include "timeslot/data/FileOccasionRepository.hpp"

#include "timeslot/core/OverlapQuery.hpp"

#include <algorithm>

namespace timeslot {
namespace data {

FileOccasionRepository::FileOccasionRepository(std::shared_ptr<FileScheduleStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Occasion> FileOccasionRepository::loadOccasionsForDay(const QDate &day,
                                                                  const std::optional<QUuid> &owner) const
{
    if (!m_storage) {
        return {};
    }
    const auto &occasions = m_storage->occasions();
    const std::vector<Occasion> all(occasions.cbegin(), occasions.cend());
    return core::dailyOccasions(all, core::startOfDay(day), owner);
}

std::vector<Occasion> FileOccasionRepository::fetchOccasions(const QUuid &eventId) const
{
    std::vector<Occasion> result;
    if (!m_storage) {
        return result;
    }
    for (const auto &occasion : m_storage->occasions()) {
        if (occasion.eventId == eventId) {
            result.push_back(occasion);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

Occasion FileOccasionRepository::saveOccasion(Occasion occasion)
{
    if (!m_storage) {
        return occasion;
    }
    return m_storage->addOrUpdateOccasion(std::move(occasion));
}

std::vector<Occasion> FileOccasionRepository::saveOccasions(std::vector<Occasion> occasions)
{
    if (!m_storage) {
        return occasions;
    }
    return m_storage->addOrUpdateOccasions(std::move(occasions));
}

int FileOccasionRepository::removeOccasions(const QUuid &eventId)
{
    if (!m_storage) {
        return 0;
    }
    return m_storage->removeOccasions(eventId);
}

} // namespace data
} // namespace timeslot
