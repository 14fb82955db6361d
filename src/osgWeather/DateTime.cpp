/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/DateTime>
#include <osgWeather/StringUtils>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iomanip>

using namespace osgWeather;
using namespace osgWeather::Util;

namespace
{
    const TimeSpan MS_PER_DAY = 86400000;

    // Days since 1970-01-01 for a proleptic Gregorian date.
    // Eras are 400-year cycles starting on March 1st.
    std::int64_t days_from_civil(std::int64_t y, int m, int d)
    {
        y -= m <= 2 ? 1 : 0;
        const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
        const std::int64_t yoe = y - era * 400;
        const std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    void civil_from_days(std::int64_t z, int& year, int& month, int& day)
    {
        z += 719468;
        const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const std::int64_t doe = z - era * 146097;
        const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const std::int64_t mp = (5 * doy + 2) / 153;
        day = (int)(doy - (153 * mp + 2) / 5 + 1);
        month = (int)(mp < 10 ? mp + 3 : mp - 9);
        year = (int)(yoe + era * 400 + (month <= 2 ? 1 : 0));
    }

    struct Fields
    {
        int year = 1970, month = 1, day = 1, hour = 0, min = 0;
        double sec = 0.0;
    };

    // Tries each layout from most to least precise; a layout matches only
    // when it consumes the whole string.
    bool scanExtended(const std::string& s, Fields& f)
    {
        const char* c = s.c_str();
        const int len = (int)s.size();
        int n = -1;

        if (sscanf(c, "%4d-%2d-%2dT%2d:%2d:%lf%n", &f.year, &f.month, &f.day, &f.hour, &f.min, &f.sec, &n) == 6 && n == len)
            return true;
        f = Fields(), n = -1;
        if (sscanf(c, "%4d-%2d-%2dT%2d:%2d%n", &f.year, &f.month, &f.day, &f.hour, &f.min, &n) == 5 && n == len)
            return true;
        f = Fields(), n = -1;
        if (sscanf(c, "%4d-%2d-%2d%n", &f.year, &f.month, &f.day, &n) == 3 && n == len)
            return true;
        f = Fields(), n = -1;
        if (sscanf(c, "%4d-%2d%n", &f.year, &f.month, &n) == 2 && n == len)
            return true;
        return false;
    }

    bool scanBasic(const std::string& s, Fields& f)
    {
        const char* c = s.c_str();
        const int len = (int)s.size();
        int n = -1;

        if (sscanf(c, "%4d%2d%2dT%2d%2d%lf%n", &f.year, &f.month, &f.day, &f.hour, &f.min, &f.sec, &n) == 6 && n == len)
            return true;
        f = Fields(), n = -1;
        if (sscanf(c, "%4d%2d%2dT%2d%2d%n", &f.year, &f.month, &f.day, &f.hour, &f.min, &n) == 5 && n == len)
            return true;
        f = Fields(), n = -1;
        if (sscanf(c, "%4d%2d%2d%2d%2d%lf%n", &f.year, &f.month, &f.day, &f.hour, &f.min, &f.sec, &n) == 6 && n == len)
            return true;
        f = Fields(), n = -1;
        if (sscanf(c, "%4d%2d%2d%n", &f.year, &f.month, &f.day, &n) == 3 && n == len)
            return true;
        f = Fields(), n = -1;
        if (sscanf(c, "%4d%2d%n", &f.year, &f.month, &n) == 2 && n == len)
            return true;
        f = Fields(), n = -1;
        if (sscanf(c, "%4d%n", &f.year, &n) == 1 && n == len)
            return true;
        return false;
    }

    // Strips a trailing zone designator ("Z", "+hh", "+hh:mm", "+hhmm" or the
    // "-" forms) and returns its offset east of UTC in minutes.
    // Returns false if the designator is malformed.
    bool stripZone(std::string& s, int& offsetMinutes)
    {
        offsetMinutes = 0;
        if (s.empty())
            return true;

        if (s.back() == 'Z' || s.back() == 'z')
        {
            s.pop_back();
            return true;
        }

        // an offset can only follow a time of day
        std::string::size_type t = s.find('T');
        if (t == std::string::npos)
            return true;

        std::string::size_type sign = s.find_first_of("+-", t);
        if (sign == std::string::npos)
            return true;

        std::string zone = s.substr(sign + 1);
        int hh = 0, mm = 0, n = -1;
        const int len = (int)zone.size();
        bool ok =
            (len == 5 && sscanf(zone.c_str(), "%2d:%2d%n", &hh, &mm, &n) == 2 && n == len) ||
            (len == 4 && sscanf(zone.c_str(), "%2d%2d%n", &hh, &mm, &n) == 2 && n == len) ||
            (len == 2 && sscanf(zone.c_str(), "%2d%n", &hh, &n) == 1 && n == len);

        if (!ok || hh < 0 || hh > 14 || mm < 0 || mm > 59)
            return false;

        offsetMinutes = (hh * 60 + mm) * (s[sign] == '-' ? -1 : 1);
        s.erase(sign);
        return true;
    }
}

//------------------------------------------------------------------------

DateTime::DateTime() :
    _valid(false),
    _time(0),
    _year(1970), _month(1), _day(1),
    _hour(0), _min(0), _sec(0), _msec(0)
{
    //nop
}

DateTime::DateTime(TimeStamp utc) :
    DateTime()
{
    setTime(utc);
}

DateTime::DateTime(int year, int month, int day, double hours) :
    DateTime()
{
    double hour_whole = std::floor(hours);
    double min = (hours - hour_whole) * 60.0;
    double min_whole = std::floor(min);
    double sec = (min - min_whole) * 60.0;
    setFields(year, month, day, (int)hour_whole, (int)min_whole, sec);
}

DateTime::DateTime(const std::string& input) :
    DateTime()
{
    std::string str = trim(input);
    if (str.empty())
        return;

    if (str.size() > 10 && str[4] == '-' && str[10] == ' ')
        str[10] = 'T';

    int offsetMinutes = 0;
    if (!stripZone(str, offsetMinutes))
        return;

    Fields f;
    bool parsed = str.find('-') == std::string::npos ?
        scanBasic(str, f) :
        scanExtended(str, f);

    if (parsed)
    {
        setFields(f.year, f.month, f.day, f.hour, f.min, f.sec);
        if (_valid && offsetMinutes != 0)
        {
            setTime(_time - (TimeStamp)offsetMinutes * 60000);
        }
    }
}

DateTime
DateTime::now()
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
    return DateTime((TimeStamp)ms.count());
}

bool
DateTime::isLeapYear(int year)
{
    return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

int
DateTime::daysInMonth(int year, int month)
{
    static const int days[12] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month < 1 || month > 12)
        return 0;
    return month == 2 && isLeapYear(year) ? 29 : days[month - 1];
}

void
DateTime::setFields(int year, int month, int day, int hour, int min, double sec)
{
    if (month < 1 || month > 12 ||
        day < 1 || day > daysInMonth(year, month) ||
        hour < 0 || hour > 23 ||
        min < 0 || min > 59 ||
        sec < 0.0 || sec >= 61.0)
    {
        _valid = false;
        return;
    }

    TimeStamp t = days_from_civil(year, month, day) * MS_PER_DAY;
    t += ((TimeStamp)hour * 3600 + (TimeStamp)min * 60) * 1000;
    t += (TimeStamp)std::llround(sec * 1000.0);

    // normalizes a leap second or rounding carry into the next minute
    setTime(t);
}

void
DateTime::setTime(TimeStamp t)
{
    _valid = true;
    _time = t;

    std::int64_t days = t / MS_PER_DAY;
    TimeSpan rem = t % MS_PER_DAY;
    if (rem < 0)
    {
        rem += MS_PER_DAY;
        --days;
    }

    civil_from_days(days, _year, _month, _day);

    _hour = (int)(rem / 3600000);
    _min = (int)((rem / 60000) % 60);
    _sec = (int)((rem / 1000) % 60);
    _msec = (int)(rem % 1000);
}

double
DateTime::hours() const
{
    return (double)_hour + (double)_min / 60.0 + ((double)_sec + (double)_msec / 1000.0) / 3600.0;
}

std::string
DateTime::asISO8601() const
{
    Stringify buf;
    buf << std::setfill('0')
        << std::setw(4) << _year << '-'
        << std::setw(2) << _month << '-'
        << std::setw(2) << _day
        << 'T'
        << std::setw(2) << _hour << ':'
        << std::setw(2) << _min << ':'
        << std::setw(2) << _sec;

    if (_msec != 0)
        buf << '.' << std::setw(3) << _msec;

    buf << 'Z';
    return buf;
}

std::string
DateTime::asCompactISO8601() const
{
    return Stringify()
        << std::setfill('0')
        << std::setw(4) << _year
        << std::setw(2) << _month
        << std::setw(2) << _day
        << 'T'
        << std::setw(2) << _hour
        << std::setw(2) << _min
        << std::setw(2) << _sec
        << 'Z';
}

DateTime
DateTime::addMonths(int months) const
{
    if (!_valid)
        return *this;

    int total = (_year * 12 + (_month - 1)) + months;
    int year = total >= 0 ? total / 12 : (total - 11) / 12;
    int month = total - year * 12 + 1;
    int day = std::min(_day, daysInMonth(year, month));

    TimeSpan timeOfDay = ((TimeSpan)_hour * 3600 + (TimeSpan)_min * 60 + _sec) * 1000 + _msec;
    return DateTime(days_from_civil(year, month, day) * MS_PER_DAY + timeOfDay);
}

DateTime
DateTime::operator + (TimeSpan span) const
{
    if (!_valid)
        return *this;
    return DateTime(_time + span);
}
