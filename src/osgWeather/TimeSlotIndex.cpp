/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/TimeSlotIndex>
#include <osgWeather/StringUtils>
#include <algorithm>
#include <iomanip>

using namespace osgWeather;
using namespace osgWeather::Util;

#define LC "[TimeSlotIndex] "

TimeSlotIndex::TimeSlotIndex(const std::string& basePath, const std::string& extension) :
    _basePath(basePath),
    _extension(extension)
{
    //nop
}

std::string
TimeSlotIndex::makeKey(unsigned ordinal)
{
    return Stringify() << std::setfill('0') << std::setw(2) << ordinal;
}

Status
TimeSlotIndex::build(PeriodicTimeSequence& sequence)
{
    Result<unsigned> intervals = sequence.intervalCount();
    if (!intervals.ok())
    {
        OW_WARN << LC << intervals.status().message() << std::endl;
        return intervals.status();
    }

    const unsigned expected = intervals.value() + 1u;
    if (_slots.size() == expected)
        return STATUS_OK;

    _slots.clear();
    _slots.reserve(expected);

    sequence.reset();

    for (unsigned i = 0; i < expected; ++i)
    {
        Slot slot;
        slot.timestamp = sequence.current().asTimeStamp();
        slot.key = makeKey(i);
        slot.dataPath = _basePath + slot.key + _extension;
        _slots.push_back(slot);

        sequence.advance();
    }

    OW_INFO << LC << "Built " << _slots.size() << " slots for " << sequence.toString() << std::endl;

    return STATUS_OK;
}

Result<TimeSlotIndex::Slot>
TimeSlotIndex::nearest(TimeStamp query) const
{
    if (_slots.empty())
    {
        return Status(Status::AssertionFailure, "Nearest-time query on an empty time slot index");
    }

    if (query <= _slots.front().timestamp)
        return _slots.front();

    if (query >= _slots.back().timestamp)
        return _slots.back();

    // first slot later than the query; its predecessor is at or before it
    auto right = std::upper_bound(
        _slots.begin(), _slots.end(), query,
        [](TimeStamp t, const Slot& slot) { return t < slot.timestamp; });

    auto left = right - 1;

    TimeSpan dl = query - left->timestamp;
    TimeSpan dr = right->timestamp - query;

    return dl <= dr ? *left : *right;
}

const TimeSlotIndex::Slot*
TimeSlotIndex::findSlot(const std::string& key) const
{
    for (auto& slot : _slots)
    {
        if (slot.key == key)
            return &slot;
    }
    return nullptr;
}

std::vector<TimeStamp>
TimeSlotIndex::getAvailableTimes() const
{
    std::vector<TimeStamp> times;
    times.reserve(_slots.size());
    for (auto& slot : _slots)
        times.push_back(slot.timestamp);
    return times;
}
