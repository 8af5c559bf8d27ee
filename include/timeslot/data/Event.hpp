#pragma once

#include <QString>
#include <QUuid>

namespace timeslot {
namespace data {

struct EventType
{
    QString abbr;
    QString label;
};

struct Event
{
    QUuid id = QUuid::createUuid();
    QString title;
    QString description;
    EventType eventType;
    QString recurrenceRule; // RRULE text used for the last expansion
};

} // namespace data
} // namespace timeslot
