#include "timeslot/core/TimeslotSettings.hpp"

#include "timeslot/core/Errors.hpp"

#include <QSettings>

namespace timeslot {
namespace core {

namespace {
constexpr auto TIME_FORMAT = "hh:mm";

const QString KEY_INTERVAL = QStringLiteral("timeslot/interval");
const QString KEY_START_TIME = QStringLiteral("timeslot/startTime");
const QString KEY_SPAN = QStringLiteral("timeslot/spanMinutes");
const QString KEY_MIN_COLUMNS = QStringLiteral("timeslot/minColumns");
const QString KEY_TIME_FORMAT = QStringLiteral("timeslot/timeFormat");
const QString KEY_DEFAULT_DURATION = QStringLiteral("timeslot/defaultDurationMinutes");
const QString KEY_FIRST_WEEKDAY = QStringLiteral("timeslot/firstWeekday");
const QString KEY_EVENT_TYPES = QStringLiteral("timeslot/knownEventTypes");
} // namespace

TimeslotSettings TimeslotSettings::load(const QSettings &settings)
{
    TimeslotSettings result;

    const int interval = settings.value(KEY_INTERVAL, static_cast<int>(result.grid.slotInterval.count())).toInt();
    result.grid.slotInterval = std::chrono::minutes(interval);

    const QString startText = settings.value(KEY_START_TIME).toString();
    if (!startText.isEmpty()) {
        const QTime start = QTime::fromString(startText, QLatin1String(TIME_FORMAT));
        if (!start.isValid()) {
            throw InvalidConfigError("invalid timeslot start time '" + startText.toStdString() + "'");
        }
        result.grid.startTime = start;
    }

    const int span = settings.value(KEY_SPAN, static_cast<int>(result.grid.spanDuration.count())).toInt();
    result.grid.spanDuration = std::chrono::minutes(span);
    result.grid.minColumns = settings.value(KEY_MIN_COLUMNS, result.grid.minColumns).toInt();
    result.timeFormat = settings.value(KEY_TIME_FORMAT, result.timeFormat).toString();

    const int duration = settings.value(KEY_DEFAULT_DURATION,
                                        static_cast<int>(result.defaultOccasionDuration.count())).toInt();
    result.defaultOccasionDuration = std::chrono::minutes(qMax(0, duration));

    const int weekday = settings.value(KEY_FIRST_WEEKDAY, static_cast<int>(result.firstWeekday)).toInt();
    if (weekday >= Qt::Monday && weekday <= Qt::Sunday) {
        result.firstWeekday = static_cast<Qt::DayOfWeek>(weekday);
    }
    result.knownEventTypes = settings.value(KEY_EVENT_TYPES).toStringList();

    result.grid.validate();
    return result;
}

void TimeslotSettings::save(QSettings &settings) const
{
    settings.setValue(KEY_INTERVAL, static_cast<int>(grid.slotInterval.count()));
    settings.setValue(KEY_START_TIME, grid.startTime.toString(QLatin1String(TIME_FORMAT)));
    settings.setValue(KEY_SPAN, static_cast<int>(grid.spanDuration.count()));
    settings.setValue(KEY_MIN_COLUMNS, grid.minColumns);
    settings.setValue(KEY_TIME_FORMAT, timeFormat);
    settings.setValue(KEY_DEFAULT_DURATION, static_cast<int>(defaultOccasionDuration.count()));
    settings.setValue(KEY_FIRST_WEEKDAY, static_cast<int>(firstWeekday));
    settings.setValue(KEY_EVENT_TYPES, knownEventTypes);
}

} // namespace core
} // namespace timeslot
