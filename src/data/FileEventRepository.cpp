#include "timeslot/data/FileEventRepository.hpp"

#include <algorithm>

namespace timeslot {
namespace data {

FileEventRepository::FileEventRepository(std::shared_ptr<FileScheduleStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Event> FileEventRepository::fetchEvents() const
{
    std::vector<Event> result;
    if (!m_storage) {
        return result;
    }

    const auto &events = m_storage->events();
    result.reserve(static_cast<size_t>(events.size()));
    for (auto it = events.constBegin(); it != events.constEnd(); ++it) {
        result.push_back(it.value());
    }
    std::sort(result.begin(), result.end(), [](const Event &lhs, const Event &rhs) {
        return lhs.title < rhs.title;
    });
    return result;
}

std::optional<Event> FileEventRepository::findById(const QUuid &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &events = m_storage->events();
    if (events.contains(id)) {
        return events.value(id);
    }
    return std::nullopt;
}

Event FileEventRepository::addEvent(Event event)
{
    if (!m_storage) {
        return event;
    }
    return m_storage->addOrUpdateEvent(std::move(event));
}

bool FileEventRepository::updateEvent(const Event &event)
{
    if (!m_storage) {
        return false;
    }
    if (!m_storage->events().contains(event.id)) {
        return false;
    }
    m_storage->addOrUpdateEvent(event);
    return true;
}

bool FileEventRepository::removeEvent(const QUuid &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeEvent(id);
}

} // namespace data
} // namespace timeslot
