#pragma once

#include "timeslot/data/FileScheduleStorage.hpp"
#include "timeslot/data/OccasionRepository.hpp"

#include <memory>

namespace timeslot {
namespace data {

class FileOccasionRepository : public OccasionRepository
{
public:
    explicit FileOccasionRepository(std::shared_ptr<FileScheduleStorage> storage);
    ~FileOccasionRepository() override = default;

    std::vector<Occasion> loadOccasionsForDay(const QDate &day,
                                              const std::optional<QUuid> &owner = std::nullopt) const override;
    std::vector<Occasion> fetchOccasions(const QUuid &eventId) const override;
    Occasion saveOccasion(Occasion occasion) override;
    std::vector<Occasion> saveOccasions(std::vector<Occasion> occasions) override;
    int removeOccasions(const QUuid &eventId) override;

private:
    std::shared_ptr<FileScheduleStorage> m_storage;
};

} // namespace data
} // namespace timeslot
