#pragma once

#include <QDateTime>
#include <vector>

#include "timeslot/core/RecurrenceRule.hpp"
#include "timeslot/core/TimeInterval.hpp"

namespace timeslot {
namespace core {

class RecurrenceExpander
{
public:
    // Expands [start, end] by rule into a finite, ascending list of intervals
    // of the same duration. A rule without count and until yields the input
    // interval only. Throws InvalidRuleError / InvalidIntervalError; nothing is
    // produced on failure.
    std::vector<TimeInterval> expand(const QDateTime &start,
                                     const QDateTime &end,
                                     const RecurrenceRule &rule) const;

    // Anchor instants of a bounded rule, each >= start.
    std::vector<QDateTime> anchors(const QDateTime &start, const RecurrenceRule &rule) const;
};

} // namespace core
} // namespace timeslot
