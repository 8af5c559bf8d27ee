#pragma once

#include "timeslot/data/EventRepository.hpp"
#include "timeslot/data/FileScheduleStorage.hpp"

#include <memory>

namespace timeslot {
namespace data {

class FileEventRepository : public EventRepository
{
public:
    explicit FileEventRepository(std::shared_ptr<FileScheduleStorage> storage);
    ~FileEventRepository() override = default;

    std::vector<Event> fetchEvents() const override;
    std::optional<Event> findById(const QUuid &id) const override;
    Event addEvent(Event event) override;
    bool updateEvent(const Event &event) override;
    bool removeEvent(const QUuid &id) override;

private:
    std::shared_ptr<FileScheduleStorage> m_storage;
};

} // namespace data
} // namespace timeslot
