/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/ImageResource>

using namespace osgWeather;

ImageResource::ImageResource(const std::string& identifier, const std::string& locator) :
    _identifier(identifier),
    _locator(locator),
    _state(STATE_NOT_REQUESTED),
    _sizeBytes(0u),
    _failedAt(0),
    _numFetches(0u)
{
    //nop
}

const char*
ImageResource::toString(State state)
{
    switch (state)
    {
    case STATE_NOT_REQUESTED: return "not requested";
    case STATE_IN_FLIGHT: return "in flight";
    case STATE_READY: return "ready";
    case STATE_FAILED: return "failed";
    }
    return "unknown";
}

void
ImageResource::setInFlight()
{
    _state = STATE_IN_FLIGHT;
    ++_numFetches;
}

void
ImageResource::setReady(osg::Image* image, std::size_t sizeBytes)
{
    _state = STATE_READY;
    _image = image;
    _sizeBytes = sizeBytes;
    _lastError = STATUS_OK;
}

void
ImageResource::setFailed(TimeStamp when, const Status& reason)
{
    _state = STATE_FAILED;
    _image = nullptr;
    _sizeBytes = 0u;
    _failedAt = when;
    _lastError = reason;
}

void
ImageResource::setNotRequested()
{
    _state = STATE_NOT_REQUESTED;
    _image = nullptr;
    _sizeBytes = 0u;
}
