#include "timeslot/core/TimeInterval.hpp"

#include "timeslot/core/Errors.hpp"

namespace timeslot {
namespace core {

TimeInterval::TimeInterval(QDateTime start, QDateTime end)
    : m_start(std::move(start))
    , m_end(std::move(end))
{
    if (!m_start.isValid() || !m_end.isValid()) {
        throw InvalidIntervalError("interval bounds must be valid date-times");
    }
    if (m_end < m_start) {
        throw InvalidIntervalError("interval end precedes its start");
    }
}

qint64 TimeInterval::durationSecs() const
{
    return m_start.secsTo(m_end);
}

bool TimeInterval::operator==(const TimeInterval &other) const
{
    return m_start == other.m_start && m_end == other.m_end;
}

} // namespace core
} // namespace timeslot
