/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/Clock>
#include <chrono>

using namespace osgWeather;

TimeStamp
SystemClock::now() const
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
    return (TimeStamp)ms.count();
}

ManualClock::ManualClock(TimeStamp start) :
    _now(start)
{
    //nop
}

TimeStamp
ManualClock::now() const
{
    return _now.load();
}

void
ManualClock::set(TimeStamp t)
{
    _now.store(t);
}

void
ManualClock::advance(TimeSpan span)
{
    _now.fetch_add(span);
}
