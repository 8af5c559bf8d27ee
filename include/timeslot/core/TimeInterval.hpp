#pragma once

#include <QDateTime>

namespace timeslot {
namespace core {

class TimeInterval
{
public:
    TimeInterval() = default;
    // Throws InvalidIntervalError when end precedes start.
    TimeInterval(QDateTime start, QDateTime end);

    const QDateTime &start() const { return m_start; }
    const QDateTime &end() const { return m_end; }
    qint64 durationSecs() const;

    bool operator==(const TimeInterval &other) const;
    bool operator!=(const TimeInterval &other) const { return !(*this == other); }

private:
    QDateTime m_start;
    QDateTime m_end;
};

} // namespace core
} // namespace timeslot
