/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/TimeSeriesLayer>
#include <osg/Math>

using namespace osgWeather;

#define LC "[TimeSeriesLayer] \"" << getName() << "\" "

//........................................................................

Config
TimeSeriesLayer::Options::getConfig() const
{
    Config conf = Layer::Options::getConfig();
    conf.key() = "time_series";
    conf.set("base_path", basePath());
    conf.set("sequence", sequence());
    conf.set("extension", extension());
    conf.set("time", time());
    conf.set("opacity", opacity());
    conf.set("detail_control", detailControl());
    conf.set("min_active_altitude", minActiveAltitude());
    conf.set("suppress_prefetch_notify", suppressPrefetchNotify());
    conf.set("suppress_render_notify", suppressRenderNotify());
    return conf;
}

void
TimeSeriesLayer::Options::fromConfig(const Config& conf)
{
    name().setDefault("Time Series");
    sequence().init("2016-07-12/2016-07-18/PT3H");
    extension().init(".png");
    opacity().init(1.0f);
    minActiveAltitude().init(3.0e6);
    suppressPrefetchNotify().init(true);
    suppressRenderNotify().init(false);

    conf.get("base_path", basePath());
    conf.get("sequence", sequence());
    conf.get("extension", extension());
    conf.get("time", time());
    conf.get("opacity", opacity());
    conf.get("detail_control", detailControl());
    conf.get("min_active_altitude", minActiveAltitude());
    conf.get("suppress_prefetch_notify", suppressPrefetchNotify());
    conf.get("suppress_render_notify", suppressRenderNotify());
}

//........................................................................

TimeSeriesLayer::TimeSeriesLayer() :
    Layer(&_optionsConcrete),
    _inCurrentFrame(false)
{
    //nop
}

TimeSeriesLayer::TimeSeriesLayer(const Options& options) :
    Layer(&_optionsConcrete),
    _optionsConcrete(options),
    _inCurrentFrame(false)
{
    //nop
}

void
TimeSeriesLayer::setResourceContext(ResourceContext* context)
{
    osg::ref_ptr<ResourceContext> current;
    if (_context.lock(current) && current.get() == context)
        return;

    _context = context;
    _resources.clear();
    _lastRenderedKey.clear();
    _inCurrentFrame = false;
}

osg::ref_ptr<ResourceContext>
TimeSeriesLayer::getResourceContext() const
{
    osg::ref_ptr<ResourceContext> context;
    _context.lock(context);
    return context;
}

void
TimeSeriesLayer::setOpacity(float value)
{
    options().opacity() = osg::clampBetween(value, 0.0f, 1.0f);
}

float
TimeSeriesLayer::getOpacity() const
{
    return osg::clampBetween(options().opacity().get(), 0.0f, 1.0f);
}

void
TimeSeriesLayer::setDetailControl(float value)
{
    options().detailControl() = value;
}

DisplayParameters
TimeSeriesLayer::getDisplayParameters() const
{
    DisplayParameters params;
    params.opacity = getOpacity();
    params.detailControl = options().detailControl();
    params.minActiveAltitude = options().minActiveAltitude().get();
    return params;
}

std::vector<TimeStamp>
TimeSeriesLayer::getAvailableTimes() const
{
    return _index.getAvailableTimes();
}

Status
TimeSeriesLayer::openImplementation()
{
    Status parent = Layer::openImplementation();
    if (parent.isError())
        return parent;

    _sequence = PeriodicTimeSequence(options().sequence().get());
    if (_sequence.getStatus().isError())
        return _sequence.getStatus();

    // reject uneven periods up front rather than at the first build
    Result<unsigned> intervals = _sequence.intervalCount();
    if (!intervals.ok())
        return intervals.status();

    _index = TimeSlotIndex(options().basePath().get(), options().extension().get());
    _resources.clear();

    if (options().time().isSet())
    {
        DateTime t(options().time().get());
        if (!t.isValid())
        {
            return Status(Status::ConfigurationError,
                "Invalid time \"" + options().time().get() + "\"");
        }
        _time = t;
    }
    else if (!_time.isValid())
    {
        _time = _sequence.start();
    }

    return STATUS_OK;
}

Status
TimeSeriesLayer::buildIndex()
{
    if (!isOpen() && open().isError())
        return getStatus();

    return _index.build(_sequence);
}

Status
TimeSeriesLayer::prepare(osg::ref_ptr<ResourceContext>& context)
{
    if (!_context.lock(context))
    {
        OW_WARN << LC << "No resource context" << std::endl;
        return Status(Status::ServiceUnavailable, "Layer \"" + getName() + "\" has no resource context");
    }

    return buildIndex();
}

ImageResource*
TimeSeriesLayer::getOrCreateSlotResource(ResourceContext* context, const TimeSlotIndex::Slot& slot)
{
    osg::ref_ptr<ImageResource>& resource = _resources[slot.key];
    if (!resource.valid())
    {
        resource = context->getOrCreateResource(slot.dataPath, slot.dataPath);
    }
    return resource.get();
}

ImageResource*
TimeSeriesLayer::getSlotResource(const std::string& key) const
{
    auto i = _resources.find(key);
    return i != _resources.end() ? i->second.get() : nullptr;
}

bool
TimeSeriesLayer::isSlotReady(const std::string& key) const
{
    osg::ref_ptr<ResourceContext> context;
    if (!_context.lock(context))
        return false;

    const TimeSlotIndex::Slot* slot = _index.findSlot(key);
    return slot && context->isReady(slot->dataPath);
}

Status
TimeSeriesLayer::prePopulate()
{
    osg::ref_ptr<ResourceContext> context;
    Status status = prepare(context);
    if (status.isError())
        return status;

    ResourceContext::FetchMode mode = options().suppressPrefetchNotify() == true ?
        ResourceContext::FETCH_SUPPRESS_NOTIFY :
        ResourceContext::FETCH_NOTIFY;

    unsigned started = 0u;
    for (auto& slot : _index.getSlots())
    {
        getOrCreateSlotResource(context.get(), slot);

        ResourceContext::Disposition disposition = context->ensureFetchStarted(slot.dataPath, slot.dataPath, mode);
        if (disposition == ResourceContext::NO_FETCHER)
            return Status(Status::ServiceUnavailable, "Resource context has no fetcher");
        else if (disposition == ResourceContext::STARTED)
            ++started;
    }

    OW_INFO << LC << "Prefetching " << started << " of " << _index.size() << " slots" << std::endl;

    return STATUS_OK;
}

bool
TimeSeriesLayer::isPrePopulated() const
{
    osg::ref_ptr<ResourceContext> context;
    if (!_context.lock(context) || _index.empty())
        return false;

    for (auto& slot : _index.getSlots())
    {
        if (!context->isReady(slot.dataPath))
            return false;
    }
    return true;
}

Result<RenderOutcome>
TimeSeriesLayer::render(SurfaceRenderer* renderer)
{
    return render(_time.asTimeStamp(), renderer);
}

Result<RenderOutcome>
TimeSeriesLayer::render(TimeStamp query, SurfaceRenderer* renderer)
{
    _inCurrentFrame = false;

    if (!getEnabled())
        return RENDER_SKIPPED;

    if (!renderer)
    {
        OW_WARN << LC << "No renderer" << std::endl;
        return Status(Status::ServiceUnavailable, "Layer \"" + getName() + "\" has no renderer");
    }

    osg::ref_ptr<ResourceContext> context;
    Status status = prepare(context);
    if (status.isError())
        return status;

    Result<TimeSlotIndex::Slot> slot = _index.nearest(query);
    if (!slot.ok())
        return slot.status();

    ImageResource* resource = getOrCreateSlotResource(context.get(), slot.value());

    // a time not covered by prefetching still gets fetched on demand
    ResourceContext::Disposition disposition = context->ensureFetchStarted(
        slot->dataPath,
        slot->dataPath,
        options().suppressRenderNotify() == true ?
            ResourceContext::FETCH_SUPPRESS_NOTIFY :
            ResourceContext::FETCH_NOTIFY);

    if (disposition == ResourceContext::NO_FETCHER)
        return Status(Status::ServiceUnavailable, "Resource context has no fetcher");

    if (!context->isReady(slot->dataPath))
        return RENDER_NOT_READY;

    renderer->drawSurfaceImage(*resource, getDisplayParameters());

    _lastRenderedKey = slot->key;
    _inCurrentFrame = true;
    return RENDER_DRAWN;
}
