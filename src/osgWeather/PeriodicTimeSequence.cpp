/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/PeriodicTimeSequence>
#include <osgWeather/StringUtils>
#include <cctype>
#include <cmath>
#include <cstdlib>

using namespace osgWeather;
using namespace osgWeather::Util;

#define LC "[PeriodicTimeSequence] "

namespace
{
    const TimeSpan MS_PER_SECOND = 1000;
    const TimeSpan MS_PER_MINUTE = 60 * MS_PER_SECOND;
    const TimeSpan MS_PER_HOUR = 60 * MS_PER_MINUTE;
    const TimeSpan MS_PER_DAY = 24 * MS_PER_HOUR;
    const TimeSpan MS_PER_WEEK = 7 * MS_PER_DAY;

}

const unsigned PeriodicTimeSequence::MAX_INTERVALS = 1000000u;

//........................................................................

DateTime
PeriodicTimeSequence::Period::after(const DateTime& t) const
{
    DateTime result = t;
    if (isCalendar())
        result = result.addMonths(years * 12 + months);
    return result + span;
}

std::string
PeriodicTimeSequence::Period::toString() const
{
    Stringify buf;
    buf << "P";
    if (years > 0) buf << years << "Y";
    if (months > 0) buf << months << "M";

    TimeSpan rem = span;
    TimeSpan days = rem / MS_PER_DAY; rem -= days * MS_PER_DAY;
    if (days > 0) buf << days << "D";

    if (rem > 0)
    {
        TimeSpan hours = rem / MS_PER_HOUR; rem -= hours * MS_PER_HOUR;
        TimeSpan minutes = rem / MS_PER_MINUTE; rem -= minutes * MS_PER_MINUTE;

        buf << "T";
        if (hours > 0) buf << hours << "H";
        if (minutes > 0) buf << minutes << "M";
        if (rem > 0)
        {
            if (rem % MS_PER_SECOND == 0)
                buf << (rem / MS_PER_SECOND) << "S";
            else
                buf << ((double)rem / 1000.0) << "S";
        }
    }
    else if (years == 0 && months == 0 && days == 0)
    {
        buf << "T0S";
    }

    return buf;
}

Result<PeriodicTimeSequence::Period>
PeriodicTimeSequence::Period::parse(const std::string& input)
{
    std::string str = trim(input);
    if (str.size() < 2 || ::toupper(str[0]) != 'P')
    {
        return Status(Status::ConfigurationError, "Invalid period \"" + input + "\"");
    }

    Period period;
    bool inTime = false;
    bool any = false;
    const char* p = str.c_str() + 1;

    while (*p)
    {
        if (::toupper(*p) == 'T')
        {
            if (inTime)
                return Status(Status::ConfigurationError, "Invalid period \"" + input + "\"");
            inTime = true;
            ++p;
            continue;
        }

        char* endp = nullptr;
        double value = std::strtod(p, &endp);
        if (endp == p || *endp == '\0' || value < 0.0)
        {
            return Status(Status::ConfigurationError, "Invalid period \"" + input + "\"");
        }

        char designator = (char)::toupper(*endp);
        bool whole = std::floor(value) == value;

        if (!inTime && designator == 'Y' && whole)
            period.years += (int)value;
        else if (!inTime && designator == 'M' && whole)
            period.months += (int)value;
        else if (!inTime && designator == 'W')
            period.span += (TimeSpan)std::llround(value * (double)MS_PER_WEEK);
        else if (!inTime && designator == 'D')
            period.span += (TimeSpan)std::llround(value * (double)MS_PER_DAY);
        else if (inTime && designator == 'H')
            period.span += (TimeSpan)std::llround(value * (double)MS_PER_HOUR);
        else if (inTime && designator == 'M')
            period.span += (TimeSpan)std::llround(value * (double)MS_PER_MINUTE);
        else if (inTime && designator == 'S')
            period.span += (TimeSpan)std::llround(value * (double)MS_PER_SECOND);
        else
            return Status(Status::ConfigurationError, "Invalid period \"" + input + "\"");

        any = true;
        p = endp + 1;
    }

    if (!any)
    {
        return Status(Status::ConfigurationError, "Empty period \"" + input + "\"");
    }

    return period;
}

//........................................................................

PeriodicTimeSequence::PeriodicTimeSequence() :
    _status(Status::ConfigurationError, "Time sequence not configured")
{
    //nop
}

PeriodicTimeSequence::PeriodicTimeSequence(const std::string& definition)
{
    StringVector parts = split(definition, '/');
    if (parts.size() != 3)
    {
        _status = Status(Status::ConfigurationError,
            "Time sequence \"" + definition + "\" is not of the form start/end/period");
        return;
    }

    _start = DateTime(parts[0]);
    _end = DateTime(parts[1]);

    Result<Period> period = Period::parse(parts[2]);
    if (!period.ok())
    {
        _status = period.status();
        return;
    }
    _period = period.value();

    validate();
}

PeriodicTimeSequence::PeriodicTimeSequence(const DateTime& start, const DateTime& end, const Period& period) :
    _start(start),
    _end(end),
    _period(period)
{
    validate();
}

void
PeriodicTimeSequence::validate()
{
    if (!_start.isValid() || !_end.isValid())
    {
        _status = Status(Status::ConfigurationError, "Invalid start or end time");
    }
    else if (_end < _start)
    {
        _status = Status(Status::ConfigurationError,
            "End time " + _end.asISO8601() + " precedes start time " + _start.asISO8601());
    }
    else if (!_period.isPositive())
    {
        _status = Status(Status::ConfigurationError, "Period must be greater than zero");
    }
    else
    {
        _status = STATUS_OK;
    }

    _current = _start;
}

void
PeriodicTimeSequence::advance()
{
    if (_status.isError())
        return;

    DateTime next = _period.after(_current);
    _current = next > _end ? _start : next;
}

void
PeriodicTimeSequence::reset()
{
    _current = _start;
}

Result<unsigned>
PeriodicTimeSequence::intervalCount() const
{
    if (_status.isError())
        return _status;

    if (!_period.isCalendar())
    {
        TimeSpan range = _end - _start;
        if (range % _period.span != 0)
        {
            return Status(Status::ConfigurationError,
                "Period " + _period.toString() + " does not evenly divide the range of " + toString());
        }

        TimeSpan count = range / _period.span;
        if (count > (TimeSpan)MAX_INTERVALS)
        {
            return Status(Status::ConfigurationError,
                "Sequence " + toString() + " has " + Util::toString(count) +
                " periods; the limit is " + Util::toString(MAX_INTERVALS));
        }
        return (unsigned)count;
    }

    // calendar periods vary in length, so count them out
    unsigned count = 0u;
    DateTime t = _start;
    while (t < _end && count < MAX_INTERVALS)
    {
        t = _period.after(t);
        ++count;
    }

    if (t < _end)
    {
        return Status(Status::ConfigurationError,
            "Sequence " + toString() + " has more than " + Util::toString(MAX_INTERVALS) + " periods");
    }

    if (t != _end)
    {
        return Status(Status::ConfigurationError,
            "Period " + _period.toString() + " does not evenly divide the range of " + toString());
    }
    return count;
}

std::string
PeriodicTimeSequence::toString() const
{
    return _start.asISO8601() + "/" + _end.asISO8601() + "/" + _period.toString();
}
