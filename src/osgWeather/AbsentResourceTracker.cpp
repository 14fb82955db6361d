/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/AbsentResourceTracker>

using namespace osgWeather;

AbsentResourceTracker::AbsentResourceTracker(TimeSpan coolDown) :
    _coolDown(coolDown)
{
    //nop
}

void
AbsentResourceTracker::markAbsent(const std::string& identifier, TimeStamp now)
{
    auto i = _entries.find(identifier);
    if (i == _entries.end())
    {
        _entries[identifier] = Entry{ now, 1u };
    }
    else
    {
        i->second.markedAt = now;
        ++i->second.numFailures;
    }
}

void
AbsentResourceTracker::unmarkAbsent(const std::string& identifier)
{
    _entries.erase(identifier);
}

bool
AbsentResourceTracker::isAbsent(const std::string& identifier, TimeStamp now) const
{
    auto i = _entries.find(identifier);
    if (i == _entries.end())
        return false;

    return now - i->second.markedAt < _coolDown;
}

bool
AbsentResourceTracker::isMarked(const std::string& identifier) const
{
    return _entries.find(identifier) != _entries.end();
}

unsigned
AbsentResourceTracker::getNumFailures(const std::string& identifier) const
{
    auto i = _entries.find(identifier);
    return i != _entries.end() ? i->second.numFailures : 0u;
}

TimeStamp
AbsentResourceTracker::getMarkedAt(const std::string& identifier) const
{
    auto i = _entries.find(identifier);
    return i != _entries.end() ? i->second.markedAt : 0;
}
