#pragma once

#include <optional>
#include <vector>

#include "timeslot/data/Event.hpp"

namespace timeslot {
namespace data {

class EventRepository
{
public:
    virtual ~EventRepository() = default;

    virtual std::vector<Event> fetchEvents() const = 0;
    virtual std::optional<Event> findById(const QUuid &id) const = 0;
    virtual Event addEvent(Event event) = 0;
    virtual bool updateEvent(const Event &event) = 0;
    virtual bool removeEvent(const QUuid &id) = 0;
};

} // namespace data
} // namespace timeslot
