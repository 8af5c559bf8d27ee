#include "timeslot/core/RecurrenceExpander.hpp"

#include "timeslot/core/Errors.hpp"
#include "timeslot/core/Logging.hpp"

#include <algorithm>

namespace timeslot {
namespace core {

namespace {
constexpr int MAX_YEAR = 9999;

template<typename T>
bool contains(const std::vector<T> &values, T value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}

// Fills in the implicit BYxxx parts a bare rule inherits from its start.
RecurrenceRule withDefaults(const QDateTime &start, RecurrenceRule rule)
{
    const bool hasDayFilter = !rule.byMonthDay.empty() || !rule.byWeekday.empty();
    if (hasDayFilter) {
        return rule;
    }
    switch (rule.frequency) {
    case Frequency::Yearly:
        if (rule.byMonth.empty()) {
            rule.byMonth.push_back(start.date().month());
        }
        rule.byMonthDay.push_back(start.date().day());
        break;
    case Frequency::Monthly:
        rule.byMonthDay.push_back(start.date().day());
        break;
    case Frequency::Weekly:
        rule.byWeekday.push_back(static_cast<Qt::DayOfWeek>(start.date().dayOfWeek()));
        break;
    default:
        break;
    }
    return rule;
}

bool matches(const QDate &date, const RecurrenceRule &rule)
{
    if (!rule.byMonth.empty() && !contains(rule.byMonth, date.month())) {
        return false;
    }
    if (!rule.byWeekday.empty()
        && !contains(rule.byWeekday, static_cast<Qt::DayOfWeek>(date.dayOfWeek()))) {
        return false;
    }
    if (!rule.byMonthDay.empty()) {
        const int fromEnd = date.day() - date.daysInMonth() - 1;
        if (!contains(rule.byMonthDay, date.day()) && !contains(rule.byMonthDay, fromEnd)) {
            return false;
        }
    }
    return true;
}

// First date after the given one that passes the day filters, or an invalid
// date when none exists before the year limit.
QDate nextMatchingDate(const QDate &after, const RecurrenceRule &rule)
{
    QDate date = after.addDays(1);
    while (date.isValid() && date.year() <= MAX_YEAR) {
        if (!rule.byMonth.empty() && !contains(rule.byMonth, date.month())) {
            date = QDate(date.year(), date.month(), 1).addMonths(1);
            continue;
        }
        if (matches(date, rule)) {
            return date;
        }
        date = date.addDays(1);
    }
    return {};
}

class AnchorCollector
{
public:
    AnchorCollector(const QDateTime &start, const RecurrenceRule &rule)
        : m_start(start)
        , m_rule(rule)
    {
    }

    // Returns false once generation has to stop.
    bool offer(const QDateTime &candidate)
    {
        if (m_rule.until && candidate > *m_rule.until) {
            return false;
        }
        if (candidate < m_start) {
            return true;
        }
        m_anchors.push_back(candidate);
        return !(m_rule.count && static_cast<int>(m_anchors.size()) >= *m_rule.count);
    }

    bool offerDate(const QDate &date)
    {
        QDateTime candidate = m_start;
        candidate.setDate(date);
        if (m_rule.until && candidate > *m_rule.until) {
            return false;
        }
        if (!matches(date, m_rule)) {
            return true;
        }
        return offer(candidate);
    }

    std::vector<QDateTime> take() { return std::move(m_anchors); }

private:
    const QDateTime &m_start;
    const RecurrenceRule &m_rule;
    std::vector<QDateTime> m_anchors;
};

qint64 secondsPerUnit(Frequency frequency)
{
    switch (frequency) {
    case Frequency::Hourly:
        return 3600;
    case Frequency::Minutely:
        return 60;
    default:
        return 1;
    }
}
} // namespace

std::vector<TimeInterval> RecurrenceExpander::expand(const QDateTime &start,
                                                     const QDateTime &end,
                                                     const RecurrenceRule &rule) const
{
    const TimeInterval base(start, end);
    rule.validate();

    if (rule.isDegenerate()) {
        return { base };
    }

    const qint64 delta = base.durationSecs();
    const std::vector<QDateTime> instants = anchors(start, rule);
    std::vector<TimeInterval> intervals;
    intervals.reserve(instants.size());
    for (const QDateTime &anchor : instants) {
        intervals.emplace_back(anchor, anchor.addSecs(delta));
    }
    qCDebug(lcRecurrence) << "expanded" << rule.toString() << "from" << start << "into"
                          << intervals.size() << "occasions";
    return intervals;
}

std::vector<QDateTime> RecurrenceExpander::anchors(const QDateTime &start, const RecurrenceRule &rule) const
{
    rule.validate();
    if (rule.isDegenerate()) {
        throw InvalidRuleError("an unbounded rule has no finite anchor sequence");
    }

    const RecurrenceRule effective = withDefaults(start, rule);
    AnchorCollector collector(start, effective);
    const QDate startDate = start.date();
    const qint64 step = effective.interval;

    switch (effective.frequency) {
    case Frequency::Daily:
        for (qint64 period = 0;; ++period) {
            const QDate date = startDate.addDays(period * step);
            if (!date.isValid() || date.year() > MAX_YEAR || !collector.offerDate(date)) {
                break;
            }
        }
        break;
    case Frequency::Weekly: {
        const int offset = (startDate.dayOfWeek() - effective.weekStart + 7) % 7;
        const QDate firstWeek = startDate.addDays(-offset);
        bool running = true;
        for (qint64 period = 0; running; ++period) {
            const QDate weekBegin = firstWeek.addDays(7 * period * step);
            if (!weekBegin.isValid() || weekBegin.year() > MAX_YEAR) {
                break;
            }
            for (int day = 0; day < 7 && running; ++day) {
                running = collector.offerDate(weekBegin.addDays(day));
            }
        }
        break;
    }
    case Frequency::Monthly: {
        const QDate firstMonth(startDate.year(), startDate.month(), 1);
        bool running = true;
        for (qint64 period = 0; running; ++period) {
            const QDate monthBegin = firstMonth.addMonths(static_cast<int>(period * step));
            if (!monthBegin.isValid() || monthBegin.year() > MAX_YEAR) {
                break;
            }
            for (int day = 0; day < monthBegin.daysInMonth() && running; ++day) {
                running = collector.offerDate(monthBegin.addDays(day));
            }
        }
        break;
    }
    case Frequency::Yearly: {
        bool running = true;
        for (qint64 period = 0; running; ++period) {
            const qint64 year = startDate.year() + period * step;
            if (year > MAX_YEAR) {
                break;
            }
            const QDate yearBegin(static_cast<int>(year), 1, 1);
            for (int day = 0; day < yearBegin.daysInYear() && running; ++day) {
                running = collector.offerDate(yearBegin.addDays(day));
            }
        }
        break;
    }
    case Frequency::Hourly:
    case Frequency::Minutely:
    case Frequency::Secondly: {
        const qint64 stepSecs = step * secondsPerUnit(effective.frequency);
        qint64 period = 0;
        while (true) {
            const QDateTime candidate = start.addSecs(period * stepSecs);
            if (!candidate.isValid() || candidate.date().year() > MAX_YEAR) {
                break;
            }
            if (!matches(candidate.date(), effective)) {
                // Resume at the first step on or after the next matching midnight.
                const QDate next = nextMatchingDate(candidate.date(), effective);
                if (!next.isValid()) {
                    break;
                }
                QDateTime midnight = start;
                midnight.setDate(next);
                midnight.setTime(QTime(0, 0));
                if (effective.until && midnight > *effective.until) {
                    break;
                }
                const qint64 gap = start.secsTo(midnight);
                period = std::max(period + 1, (gap + stepSecs - 1) / stepSecs);
                continue;
            }
            if (!collector.offer(candidate)) {
                break;
            }
            ++period;
        }
        break;
    }
    }

    return collector.take();
}

} // namespace core
} // namespace timeslot
