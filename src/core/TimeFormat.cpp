#include "timeslot/core/TimeFormat.hpp"

namespace timeslot {
namespace core {

namespace {
QString twoDigits(int value)
{
    return QStringLiteral("%1").arg(value, 2, 10, QLatin1Char('0'));
}
} // namespace

QString formatTime(const QTime &time, const QString &format)
{
    QString result;
    result.reserve(format.size() + 8);
    for (int i = 0; i < format.size(); ++i) {
        const QChar ch = format.at(i);
        if (ch != '%' || i + 1 >= format.size()) {
            result += ch;
            continue;
        }
        const QChar directive = format.at(++i);
        switch (directive.toLatin1()) {
        case 'H':
            result += twoDigits(time.hour());
            break;
        case 'I': {
            const int hour = time.hour() % 12;
            result += twoDigits(hour == 0 ? 12 : hour);
            break;
        }
        case 'M':
            result += twoDigits(time.minute());
            break;
        case 'S':
            result += twoDigits(time.second());
            break;
        case 'p':
            result += time.hour() < 12 ? QStringLiteral("AM") : QStringLiteral("PM");
            break;
        case '%':
            result += '%';
            break;
        default:
            result += ch;
            result += directive;
            break;
        }
    }
    return result;
}

std::vector<TimeslotOption> timeslotOptions(const QDate &day, const GridConfig &config, const QString &format)
{
    std::vector<TimeslotOption> options;
    for (const QDateTime &value : config.slotKeys(day)) {
        options.push_back({ value, formatTime(value.time(), format) });
    }
    return options;
}

std::pair<QDate, QDate> monthBoundaries(const QDate &date)
{
    const QDate first(date.year(), date.month(), 1);
    return { first, first.addDays(first.daysInMonth() - 1) };
}

} // namespace core
} // namespace timeslot
