#include "timeslot/core/AppContext.hpp"

#include "timeslot/core/EventScheduler.hpp"
#include "timeslot/data/DataProvider.hpp"
#include "timeslot/data/EventRepository.hpp"

#include <QDate>
#include <QObject>
#include <QTime>

namespace timeslot {
namespace core {

AppContext::AppContext(TimeslotSettings settings, QString storagePath)
    : m_settings(std::move(settings))
    , m_dataProvider(std::make_unique<data::DataProvider>(std::move(storagePath)))
    , m_scheduler(std::make_unique<EventScheduler>(m_dataProvider->eventRepository(),
                                                   m_dataProvider->occasionRepository(),
                                                   m_settings))
{
}

AppContext::~AppContext() = default;

data::EventRepository &AppContext::eventRepository()
{
    return m_dataProvider->eventRepository();
}

data::OccasionRepository &AppContext::occasionRepository()
{
    return m_dataProvider->occasionRepository();
}

EventScheduler &AppContext::scheduler()
{
    return *m_scheduler;
}

const TimeslotSettings &AppContext::settings() const
{
    return m_settings;
}

void AppContext::seedDemoData()
{
    if (!eventRepository().fetchEvents().empty()) {
        return;
    }

    const QDate today = QDate::currentDate();

    RecurrenceRule weekdays;
    weekdays.frequency = Frequency::Weekly;
    weekdays.byWeekday = { Qt::Monday, Qt::Tuesday, Qt::Wednesday, Qt::Thursday, Qt::Friday };
    weekdays.count = 20;
    m_scheduler->createEvent(QObject::tr("Daily Standup"),
                             QObject::tr("Short sync of the whole team"),
                             { QStringLiteral("meet"), QObject::tr("Meeting") },
                             QDateTime(today, QTime(9, 0)),
                             QDateTime(today, QTime(9, 30)),
                             weekdays);

    RecurrenceRule threeDays;
    threeDays.count = 3;
    m_scheduler->createEvent(QObject::tr("Design Review"),
                             QObject::tr("Walk through the open layout questions"),
                             { QStringLiteral("review"), QObject::tr("Review") },
                             QDateTime(today, QTime(9, 15)),
                             QDateTime(today, QTime(10, 45)),
                             threeDays);

    m_scheduler->createEvent(QObject::tr("Lunch Talk"),
                             QObject::tr("Guest speaker"),
                             {},
                             QDateTime(today, QTime(12, 0)),
                             QDateTime(today, QTime(13, 0)));
}

} // namespace core
} // namespace timeslot
