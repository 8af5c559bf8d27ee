#include "timeslot/data/InMemoryEventRepository.hpp"

#include <algorithm>

namespace timeslot {
namespace data {

InMemoryEventRepository::InMemoryEventRepository() = default;
InMemoryEventRepository::~InMemoryEventRepository() = default;

std::vector<Event> InMemoryEventRepository::fetchEvents() const
{
    std::vector<Event> events(m_events.cbegin(), m_events.cend());
    std::sort(events.begin(), events.end(), [](const Event &lhs, const Event &rhs) {
        return lhs.title < rhs.title;
    });
    return events;
}

std::optional<Event> InMemoryEventRepository::findById(const QUuid &id) const
{
    if (m_events.contains(id)) {
        return m_events.value(id);
    }
    return std::nullopt;
}

Event InMemoryEventRepository::addEvent(Event event)
{
    if (event.id.isNull()) {
        event.id = QUuid::createUuid();
    }
    m_events.insert(event.id, event);
    return event;
}

bool InMemoryEventRepository::updateEvent(const Event &event)
{
    if (!m_events.contains(event.id)) {
        return false;
    }
    m_events.insert(event.id, event);
    return true;
}

bool InMemoryEventRepository::removeEvent(const QUuid &id)
{
    return m_events.remove(id) > 0;
}

} // namespace data
} // namespace timeslot
