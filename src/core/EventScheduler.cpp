#include "timeslot/core/EventScheduler.hpp"

#include "timeslot/core/GridBuilder.hpp"
#include "timeslot/core/Logging.hpp"
#include "timeslot/data/EventRepository.hpp"
#include "timeslot/data/OccasionRepository.hpp"

#include <algorithm>

namespace timeslot {
namespace core {

EventScheduler::EventScheduler(data::EventRepository &events,
                               data::OccasionRepository &occasions,
                               TimeslotSettings settings)
    : m_events(events)
    , m_occasions(occasions)
    , m_settings(std::move(settings))
{
}

data::Event EventScheduler::createEvent(const QString &title,
                                        const QString &description,
                                        const data::EventType &eventType,
                                        std::optional<QDateTime> start,
                                        std::optional<QDateTime> end,
                                        const RecurrenceRule &rule)
{
    if (!start) {
        QDateTime now = QDateTime::currentDateTime();
        now.setTime(QTime(now.time().hour(), 0));
        start = now;
    }
    if (!end) {
        const auto duration = std::chrono::duration_cast<std::chrono::seconds>(m_settings.defaultOccasionDuration);
        end = start->addSecs(duration.count());
    }

    const std::vector<TimeInterval> intervals = m_expander.expand(*start, *end, rule);

    data::Event event;
    event.title = title;
    event.description = description;
    event.eventType = eventType;
    if (!rule.isDegenerate()) {
        event.recurrenceRule = rule.toString();
    }
    event = m_events.addEvent(std::move(event));
    storeOccasions(event, intervals);
    return event;
}

std::vector<data::Occasion> EventScheduler::addOccasions(const data::Event &event,
                                                         const QDateTime &start,
                                                         const QDateTime &end,
                                                         const RecurrenceRule &rule)
{
    return storeOccasions(event, m_expander.expand(start, end, rule));
}

std::vector<data::Occasion> EventScheduler::storeOccasions(const data::Event &event,
                                                           const std::vector<TimeInterval> &intervals)
{
    std::vector<data::Occasion> pending;
    pending.reserve(intervals.size());
    for (const auto &interval : intervals) {
        data::Occasion occasion;
        occasion.eventId = event.id;
        occasion.start = interval.start();
        occasion.end = interval.end();
        occasion.title = event.title;
        occasion.eventType = event.eventType.abbr;
        pending.push_back(std::move(occasion));
    }
    const auto stored = m_occasions.saveOccasions(std::move(pending));
    qCDebug(lcRecurrence) << "stored" << stored.size() << "occasions for" << event.title;
    return stored;
}

std::vector<data::Occasion> EventScheduler::upcomingOccasions(const QUuid &eventId, const QDateTime &now) const
{
    std::vector<data::Occasion> upcoming = m_occasions.fetchOccasions(eventId);
    upcoming.erase(std::remove_if(upcoming.begin(), upcoming.end(),
                                  [&now](const data::Occasion &occasion) { return occasion.start < now; }),
                   upcoming.end());
    return upcoming;
}

std::optional<data::Occasion> EventScheduler::nextOccasion(const QUuid &eventId, const QDateTime &now) const
{
    const auto upcoming = upcomingOccasions(eventId, now);
    if (upcoming.empty()) {
        return std::nullopt;
    }
    return upcoming.front();
}

std::vector<data::Occasion> EventScheduler::dailyOccasions(const QDate &day, const std::optional<QUuid> &owner) const
{
    return m_occasions.loadOccasionsForDay(day, owner);
}

Grid EventScheduler::buildDayGrid(const QDate &day, VisualClassCycler *cycler) const
{
    return GridBuilder().build(day, m_settings.grid, dailyOccasions(day), cycler);
}

const TimeslotSettings &EventScheduler::settings() const
{
    return m_settings;
}

} // namespace core
} // namespace timeslot
