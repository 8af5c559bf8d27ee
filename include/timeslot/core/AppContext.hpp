#pragma once

#include <memory>
#include <QString>

#include "timeslot/core/TimeslotSettings.hpp"

namespace timeslot {
namespace data {
class DataProvider;
class EventRepository;
class OccasionRepository;
}

namespace core {

class EventScheduler;

class AppContext
{
public:
    AppContext(TimeslotSettings settings, QString storagePath = QString());
    ~AppContext();

    data::EventRepository &eventRepository();
    data::OccasionRepository &occasionRepository();
    EventScheduler &scheduler();
    const TimeslotSettings &settings() const;

    // Adds a few sample events when the store holds none.
    void seedDemoData();

private:
    TimeslotSettings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<EventScheduler> m_scheduler;
};

} // namespace core
} // namespace timeslot
