/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/ResourceContext>
#include <vector>

using namespace osgWeather;

#define LC "[ResourceContext] "

//........................................................................

Config
ResourceContext::Options::getConfig() const
{
    Config conf("resource_context");
    conf.set("cool_down", coolDown());
    conf.set("fetch_timeout", fetchTimeout());
    conf.set("cache_size", cacheSize());
    return conf;
}

void
ResourceContext::Options::fromConfig(const Config& conf)
{
    coolDown().init(60000);
    fetchTimeout().init(30000);
    cacheSize().init(0u);

    conf.get("cool_down", coolDown());
    conf.get("fetch_timeout", fetchTimeout());
    conf.get("cache_size", cacheSize());
}

//........................................................................

ResourceContext::ResourceContext(ImageFetcher* fetcher, const Options& options) :
    _options(options),
    _fetcher(fetcher),
    _cache(options.cacheSize().get()),
    _absent(options.coolDown().get()),
    _numRedrawsRequested(0u)
{
    _decoder = new ReaderWriterDecoder();
    _clock = new SystemClock();
}

void
ResourceContext::setDecoder(ImageDecoder* decoder)
{
    _decoder = decoder ? decoder : new ReaderWriterDecoder();
}

void
ResourceContext::setClock(Clock* clock)
{
    _clock = clock ? clock : new SystemClock();
}

void
ResourceContext::setCacheCapacity(std::size_t capacityBytes)
{
    ResourceCache::Evicted evicted;
    _cache.setCapacity(capacityBytes, &evicted);
    for (auto& e : evicted)
        e->setNotRequested();

    _options.cacheSize() = (unsigned)capacityBytes;

    if (!evicted.empty())
    {
        OW_INFO << LC << "Cache capacity " << capacityBytes << " bytes; released "
            << evicted.size() << " resources" << std::endl;
    }
}

const char*
ResourceContext::toString(Disposition disposition)
{
    switch (disposition)
    {
    case ALREADY_READY: return "already ready";
    case ALREADY_IN_FLIGHT: return "already in flight";
    case SUPPRESSED_ABSENT: return "suppressed (recently failed)";
    case STARTED: return "started";
    case NO_FETCHER: return "no fetcher";
    }
    return "unknown";
}

ImageResource*
ResourceContext::getOrCreateResource(const std::string& identifier, const std::string& locator)
{
    osg::ref_ptr<ImageResource>& resource = _resources[identifier];
    if (!resource.valid())
    {
        resource = new ImageResource(identifier, locator);
    }
    return resource.get();
}

ImageResource*
ResourceContext::getResource(const std::string& identifier) const
{
    auto i = _resources.find(identifier);
    return i != _resources.end() ? i->second.get() : nullptr;
}

bool
ResourceContext::isReady(const std::string& identifier) const
{
    return _cache.contains(identifier);
}

bool
ResourceContext::isInFlight(const std::string& identifier) const
{
    return _inFlight.find(identifier) != _inFlight.end();
}

ResourceContext::Disposition
ResourceContext::ensureFetchStarted(const std::string& identifier, const std::string& locator, FetchMode mode)
{
    if (_cache.get(identifier).valid())
        return ALREADY_READY;

    if (isInFlight(identifier))
        return ALREADY_IN_FLIGHT;

    TimeStamp now = _clock->now();

    if (_absent.isAbsent(identifier, now))
        return SUPPRESSED_ABSENT;

    if (!_fetcher.valid())
    {
        OW_WARN << LC << "No fetcher installed; cannot load " << identifier << std::endl;
        return NO_FETCHER;
    }

    ImageResource* resource = getOrCreateResource(identifier, locator);
    resource->setInFlight();

    PendingFetch& fetch = _inFlight[identifier];
    fetch.resource = resource;
    fetch.issuedAt = now;
    fetch.mode = mode;
    fetch.future = _fetcher->fetch(locator);

    OW_DEBUG << LC << "Fetching " << identifier << " from " << locator
        << (mode == FETCH_SUPPRESS_NOTIFY ? " (quiet)" : "") << std::endl;

    return STARTED;
}

unsigned
ResourceContext::update()
{
    if (_inFlight.empty())
        return 0u;

    const TimeStamp now = _clock->now();
    const TimeSpan timeout = _options.fetchTimeout().get();

    // pull finished fetches out of the in-flight set before processing,
    // so that a redraw callback may safely issue new requests.
    struct Finished
    {
        PendingFetch fetch;
        FetchResult result;
    };
    std::vector<Finished> finished;

    for (auto i = _inFlight.begin(); i != _inFlight.end(); )
    {
        PendingFetch& fetch = i->second;

        if (fetch.future.available())
        {
            finished.push_back(Finished{ fetch, fetch.future.value() });
            i = _inFlight.erase(i);
        }
        else if (fetch.future.empty())
        {
            FetchResult result;
            result.status = Status(Status::ResourceUnavailable, "Fetch abandoned by the fetcher");
            finished.push_back(Finished{ fetch, result });
            i = _inFlight.erase(i);
        }
        else if (timeout > 0 && now - fetch.issuedAt >= timeout)
        {
            OW_WARN << LC << "Fetch of " << i->first << " timed out after " << timeout << " ms" << std::endl;

            // a late result lands in a future nobody is watching
            FetchResult result;
            result.status = Status(Status::ResourceUnavailable, "Fetch timed out");
            finished.push_back(Finished{ fetch, result });
            i = _inFlight.erase(i);
        }
        else
        {
            ++i;
        }
    }

    std::vector<std::string> redraws;

    for (auto& f : finished)
    {
        if (f.result.status.isOK())
        {
            if (onFetchSucceeded(f.fetch, f.result.payload, now))
                redraws.push_back(f.fetch.resource->getIdentifier());
        }
        else
        {
            onFetchFailed(f.fetch, f.result.status, now);
        }
    }

    for (auto& identifier : redraws)
    {
        ++_numRedrawsRequested;
        if (_redrawCallback)
            _redrawCallback(identifier);
    }

    return (unsigned)finished.size();
}

bool
ResourceContext::onFetchSucceeded(PendingFetch& fetch, const std::string& payload, TimeStamp now)
{
    ImageResource* resource = fetch.resource.get();
    const std::string& identifier = resource->getIdentifier();

    Result<osg::ref_ptr<osg::Image>> decoded = _decoder->decode(payload, resource->getLocator());
    if (!decoded.ok() || !decoded.value().valid())
    {
        Status reason = decoded.ok() ?
            Status(Status::ResourceUnavailable, "Decoder returned no image") :
            decoded.status();
        onFetchFailed(fetch, reason, now);
        return false;
    }

    osg::Image* image = decoded.value().get();
    std::size_t sizeBytes = image->getTotalSizeInBytesIncludingMipmaps();

    resource->setReady(image, sizeBytes);

    ResourceCache::Evicted evicted;
    _cache.insert(identifier, resource, sizeBytes, &evicted);
    for (auto& e : evicted)
        e->setNotRequested();

    _absent.unmarkAbsent(identifier);

    OW_INFO << LC << "Loaded " << identifier << " (" << sizeBytes << " bytes)" << std::endl;

    return fetch.mode == FETCH_NOTIFY;
}

void
ResourceContext::onFetchFailed(PendingFetch& fetch, const Status& reason, TimeStamp now)
{
    ImageResource* resource = fetch.resource.get();

    resource->setFailed(now, reason);
    _absent.markAbsent(resource->getIdentifier(), now);

    OW_WARN << LC << "Failed to load " << resource->getIdentifier() << ": " << reason.message() << std::endl;
}
