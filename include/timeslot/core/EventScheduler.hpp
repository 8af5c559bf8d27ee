#pragma once

#include <QDate>
#include <QDateTime>
#include <optional>
#include <vector>

#include "timeslot/core/Grid.hpp"
#include "timeslot/core/RecurrenceExpander.hpp"
#include "timeslot/core/RecurrenceRule.hpp"
#include "timeslot/core/TimeslotSettings.hpp"
#include "timeslot/data/Event.hpp"
#include "timeslot/data/Occasion.hpp"

namespace timeslot {
namespace data {
class EventRepository;
class OccasionRepository;
}

namespace core {

class VisualClassCycler;

class EventScheduler
{
public:
    EventScheduler(data::EventRepository &events,
                   data::OccasionRepository &occasions,
                   TimeslotSettings settings = {});

    // Stores a new event and its occasions. Start defaults to the current
    // hour, end to start plus the default occasion duration. The rule is
    // expanded before anything is stored, so an invalid rule leaves the
    // repositories untouched.
    data::Event createEvent(const QString &title,
                            const QString &description,
                            const data::EventType &eventType,
                            std::optional<QDateTime> start = std::nullopt,
                            std::optional<QDateTime> end = std::nullopt,
                            const RecurrenceRule &rule = {});

    std::vector<data::Occasion> addOccasions(const data::Event &event,
                                             const QDateTime &start,
                                             const QDateTime &end,
                                             const RecurrenceRule &rule = {});

    std::vector<data::Occasion> upcomingOccasions(const QUuid &eventId,
                                                  const QDateTime &now = QDateTime::currentDateTime()) const;
    std::optional<data::Occasion> nextOccasion(const QUuid &eventId,
                                               const QDateTime &now = QDateTime::currentDateTime()) const;
    std::vector<data::Occasion> dailyOccasions(const QDate &day,
                                               const std::optional<QUuid> &owner = std::nullopt) const;

    Grid buildDayGrid(const QDate &day, VisualClassCycler *cycler = nullptr) const;

    const TimeslotSettings &settings() const;

private:
    std::vector<data::Occasion> storeOccasions(const data::Event &event,
                                               const std::vector<TimeInterval> &intervals);

    data::EventRepository &m_events;
    data::OccasionRepository &m_occasions;
    TimeslotSettings m_settings;
    RecurrenceExpander m_expander;
};

} // namespace core
} // namespace timeslot
