#pragma once

#include <QDateTime>
#include <QString>
#include <optional>
#include <vector>

namespace timeslot {
namespace core {

enum class Frequency
{
    Yearly,
    Monthly,
    Weekly,
    Daily,
    Hourly,
    Minutely,
    Secondly,
};

struct RecurrenceRule
{
    Frequency frequency = Frequency::Daily;
    int interval = 1;
    std::optional<int> count;
    std::optional<QDateTime> until;
    std::vector<Qt::DayOfWeek> byWeekday;
    std::vector<int> byMonthDay; // 1..31, or -31..-1 counted from the month end
    std::vector<int> byMonth;    // 1..12
    Qt::DayOfWeek weekStart = Qt::Monday;

    // Neither count nor until: the rule stands for a single, unrepeated occasion.
    bool isDegenerate() const { return !count && !until; }

    // Throws InvalidRuleError.
    void validate() const;

    // RFC 5545 RRULE value, with or without the "RRULE:" prefix. Positional
    // BYDAY entries ("2MO") and the BYxxx parts not listed above are rejected
    // with InvalidRuleError. An empty string yields a default, degenerate rule.
    static RecurrenceRule fromString(const QString &text);
    QString toString() const;
};

QString frequencyName(Frequency frequency);

} // namespace core
} // namespace timeslot
