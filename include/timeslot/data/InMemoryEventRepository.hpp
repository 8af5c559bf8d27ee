#pragma once

#include <QHash>

#include "timeslot/data/EventRepository.hpp"

namespace timeslot {
namespace data {

class InMemoryEventRepository : public EventRepository
{
public:
    InMemoryEventRepository();
    ~InMemoryEventRepository() override;

    std::vector<Event> fetchEvents() const override;
    std::optional<Event> findById(const QUuid &id) const override;
    Event addEvent(Event event) override;
    bool updateEvent(const Event &event) override;
    bool removeEvent(const QUuid &id) override;

private:
    QHash<QUuid, Event> m_events;
};

} // namespace data
} // namespace timeslot
