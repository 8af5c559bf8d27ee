#include "timeslot/core/RecurrenceRule.hpp"

#include "timeslot/core/Errors.hpp"

#include <QStringList>
#include <array>

namespace timeslot {
namespace core {

namespace {
constexpr auto UNTIL_DATE_FORMAT = "yyyyMMdd";
constexpr auto UNTIL_DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";
constexpr auto UNTIL_UTC_FORMAT = "yyyyMMdd'T'hhmmss'Z'";

struct FrequencyName
{
    Frequency frequency;
    const char *name;
};

constexpr std::array<FrequencyName, 7> FREQUENCY_NAMES = { {
    { Frequency::Yearly, "YEARLY" },
    { Frequency::Monthly, "MONTHLY" },
    { Frequency::Weekly, "WEEKLY" },
    { Frequency::Daily, "DAILY" },
    { Frequency::Hourly, "HOURLY" },
    { Frequency::Minutely, "MINUTELY" },
    { Frequency::Secondly, "SECONDLY" },
} };

constexpr std::array<const char *, 7> WEEKDAY_CODES = { "MO", "TU", "WE", "TH", "FR", "SA", "SU" };

[[noreturn]] void fail(const QString &message)
{
    throw InvalidRuleError(message.toStdString());
}

int parseInt(const QString &key, const QString &value)
{
    bool ok = false;
    const int parsed = value.trimmed().toInt(&ok);
    if (!ok) {
        fail(QStringLiteral("%1 expects an integer, got '%2'").arg(key, value));
    }
    return parsed;
}

std::vector<int> parseIntList(const QString &key, const QString &value)
{
    std::vector<int> result;
    const QStringList parts = value.split(',', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        result.push_back(parseInt(key, part));
    }
    return result;
}

Qt::DayOfWeek parseWeekday(const QString &value)
{
    const QString code = value.trimmed().toUpper();
    for (std::size_t i = 0; i < WEEKDAY_CODES.size(); ++i) {
        if (code == QLatin1String(WEEKDAY_CODES[i])) {
            return static_cast<Qt::DayOfWeek>(i + 1);
        }
    }
    fail(QStringLiteral("unsupported weekday '%1'").arg(value));
}

QString weekdayCode(Qt::DayOfWeek day)
{
    return QString::fromLatin1(WEEKDAY_CODES[static_cast<std::size_t>(day) - 1]);
}

QDateTime parseUntil(const QString &value)
{
    if (value.length() == 8) {
        const QDate date = QDate::fromString(value, UNTIL_DATE_FORMAT);
        if (!date.isValid()) {
            fail(QStringLiteral("invalid UNTIL date '%1'").arg(value));
        }
        // A date-only UNTIL includes the whole day.
        return QDateTime(date, QTime(23, 59, 59));
    }
    if (value.endsWith('Z')) {
        QDateTime dt = QDateTime::fromString(value, UNTIL_UTC_FORMAT);
        dt.setTimeSpec(Qt::UTC);
        if (!dt.isValid()) {
            fail(QStringLiteral("invalid UNTIL date-time '%1'").arg(value));
        }
        return dt.toLocalTime();
    }
    const QDateTime dt = QDateTime::fromString(value, UNTIL_DATE_TIME_FORMAT);
    if (!dt.isValid()) {
        fail(QStringLiteral("invalid UNTIL date-time '%1'").arg(value));
    }
    return dt;
}

template<typename T, typename Fn>
QString joinList(const std::vector<T> &values, Fn toText)
{
    QStringList parts;
    for (const T &value : values) {
        parts << toText(value);
    }
    return parts.join(',');
}
} // namespace

QString frequencyName(Frequency frequency)
{
    for (const auto &entry : FREQUENCY_NAMES) {
        if (entry.frequency == frequency) {
            return QString::fromLatin1(entry.name);
        }
    }
    return {};
}

void RecurrenceRule::validate() const
{
    if (interval < 1) {
        fail(QStringLiteral("interval must be at least 1, got %1").arg(interval));
    }
    if (count && *count < 1) {
        fail(QStringLiteral("count must be at least 1, got %1").arg(*count));
    }
    if (until && !until->isValid()) {
        fail(QStringLiteral("until must be a valid date-time"));
    }
    for (int month : byMonth) {
        if (month < 1 || month > 12) {
            fail(QStringLiteral("month %1 is outside 1..12").arg(month));
        }
    }
    for (int day : byMonthDay) {
        if (day == 0 || day < -31 || day > 31) {
            fail(QStringLiteral("month day %1 is outside 1..31 / -31..-1").arg(day));
        }
    }
}

RecurrenceRule RecurrenceRule::fromString(const QString &text)
{
    RecurrenceRule rule;
    QString body = text.trimmed();
    if (body.startsWith(QLatin1String("RRULE:"), Qt::CaseInsensitive)) {
        body = body.mid(6);
    }
    if (body.isEmpty()) {
        return rule;
    }

    const QStringList parts = body.split(';', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const int eq = part.indexOf('=');
        if (eq <= 0) {
            fail(QStringLiteral("malformed rule part '%1'").arg(part));
        }
        const QString key = part.left(eq).trimmed().toUpper();
        const QString value = part.mid(eq + 1).trimmed();

        if (key == QLatin1String("FREQ")) {
            const QString name = value.toUpper();
            bool found = false;
            for (const auto &entry : FREQUENCY_NAMES) {
                if (name == QLatin1String(entry.name)) {
                    rule.frequency = entry.frequency;
                    found = true;
                    break;
                }
            }
            if (!found) {
                fail(QStringLiteral("unknown frequency '%1'").arg(value));
            }
        } else if (key == QLatin1String("INTERVAL")) {
            rule.interval = parseInt(key, value);
        } else if (key == QLatin1String("COUNT")) {
            rule.count = parseInt(key, value);
        } else if (key == QLatin1String("UNTIL")) {
            rule.until = parseUntil(value);
        } else if (key == QLatin1String("BYDAY")) {
            rule.byWeekday.clear();
            for (const QString &day : value.split(',', Qt::SkipEmptyParts)) {
                rule.byWeekday.push_back(parseWeekday(day));
            }
        } else if (key == QLatin1String("BYMONTHDAY")) {
            rule.byMonthDay = parseIntList(key, value);
        } else if (key == QLatin1String("BYMONTH")) {
            rule.byMonth = parseIntList(key, value);
        } else if (key == QLatin1String("WKST")) {
            rule.weekStart = parseWeekday(value);
        } else {
            fail(QStringLiteral("unsupported rule part '%1'").arg(key));
        }
    }

    rule.validate();
    return rule;
}

QString RecurrenceRule::toString() const
{
    QStringList parts;
    parts << QStringLiteral("FREQ=%1").arg(frequencyName(frequency));
    if (interval != 1) {
        parts << QStringLiteral("INTERVAL=%1").arg(interval);
    }
    if (count) {
        parts << QStringLiteral("COUNT=%1").arg(*count);
    }
    if (until) {
        parts << QStringLiteral("UNTIL=%1").arg(until->toString(QLatin1String(UNTIL_DATE_TIME_FORMAT)));
    }
    if (!byWeekday.empty()) {
        parts << QStringLiteral("BYDAY=%1").arg(joinList(byWeekday, weekdayCode));
    }
    if (!byMonthDay.empty()) {
        parts << QStringLiteral("BYMONTHDAY=%1").arg(joinList(byMonthDay, [](int v) { return QString::number(v); }));
    }
    if (!byMonth.empty()) {
        parts << QStringLiteral("BYMONTH=%1").arg(joinList(byMonth, [](int v) { return QString::number(v); }));
    }
    if (weekStart != Qt::Monday) {
        parts << QStringLiteral("WKST=%1").arg(weekdayCode(weekStart));
    }
    return parts.join(';');
}

} // namespace core
} // namespace timeslot
