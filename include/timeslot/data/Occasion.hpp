#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>

#include "timeslot/core/TimeInterval.hpp"

namespace timeslot {
namespace data {

// One concrete start/end pair of an event. Title and event type are copied
// from the owning event so that formatters need nothing else.
struct Occasion
{
    QUuid id = QUuid::createUuid();
    QUuid eventId;
    QDateTime start;
    QDateTime end;
    QString title;
    QString eventType;

    core::TimeInterval interval() const { return core::TimeInterval(start, end); }
};

inline bool operator<(const Occasion &lhs, const Occasion &rhs)
{
    if (lhs.start == rhs.start) {
        return lhs.end < rhs.end;
    }
    return lhs.start < rhs.start;
}

} // namespace data
} // namespace timeslot
