#pragma once

#include <stdexcept>
#include <string>

namespace timeslot {
namespace core {

class TimeslotError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Malformed recurrence rule: bad interval, count, filter value or RRULE text.
class InvalidRuleError : public TimeslotError
{
public:
    using TimeslotError::TimeslotError;
};

// Grid configuration that cannot produce a slot sequence.
class InvalidConfigError : public TimeslotError
{
public:
    using TimeslotError::TimeslotError;
};

class InvalidIntervalError : public TimeslotError
{
public:
    using TimeslotError::TimeslotError;
};

} // namespace core
} // namespace timeslot
