#include "timeslot/core/GridConfig.hpp"

#include "timeslot/core/Errors.hpp"

#include <string>

namespace timeslot {
namespace core {

namespace {
constexpr qint64 SECS_PER_DAY = 24 * 60 * 60;

QDateTime wallClock(const QDate &day, qint64 secsFromMidnight)
{
    return QDateTime(day.addDays(secsFromMidnight / SECS_PER_DAY),
                     QTime(0, 0).addSecs(static_cast<int>(secsFromMidnight % SECS_PER_DAY)));
}

qint64 toSecs(std::chrono::minutes duration)
{
    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}
} // namespace

void GridConfig::validate() const
{
    if (slotInterval.count() <= 0) {
        throw InvalidConfigError("slot interval must be positive, got "
                                 + std::to_string(slotInterval.count()) + " minutes");
    }
    if (spanDuration.count() < 0) {
        throw InvalidConfigError("span duration must not be negative");
    }
    if (!startTime.isValid()) {
        throw InvalidConfigError("grid start time is invalid");
    }
    if (minColumns < 0) {
        throw InvalidConfigError("minimum column count must not be negative");
    }
}

int GridConfig::slotCount() const
{
    validate();
    return static_cast<int>(spanDuration / slotInterval) + 1;
}

QDateTime GridConfig::gridStart(const QDate &day) const
{
    return wallClock(day, QTime(0, 0).secsTo(startTime));
}

QDateTime GridConfig::gridEnd(const QDate &day) const
{
    return wallClock(day, QTime(0, 0).secsTo(startTime) + toSecs(spanDuration));
}

std::vector<QDateTime> GridConfig::slotKeys(const QDate &day) const
{
    const int count = slotCount();
    const qint64 first = QTime(0, 0).secsTo(startTime);
    const qint64 step = toSecs(slotInterval);

    std::vector<QDateTime> keys;
    keys.reserve(static_cast<std::size_t>(count));
    for (int slot = 0; slot < count; ++slot) {
        keys.push_back(wallClock(day, first + slot * step));
    }
    return keys;
}

} // namespace core
} // namespace timeslot
