/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/SingleImageLayer>
#include <osg/Math>

using namespace osgWeather;

#define LC "[SingleImageLayer] \"" << getName() << "\" "

//........................................................................

Config
SingleImageLayer::Options::getConfig() const
{
    Config conf = Layer::Options::getConfig();
    conf.key() = "single_image";
    conf.set("url", url());
    conf.set("opacity", opacity());
    conf.set("detail_control", detailControl());
    conf.set("min_active_altitude", minActiveAltitude());
    return conf;
}

void
SingleImageLayer::Options::fromConfig(const Config& conf)
{
    name().setDefault("Background");
    opacity().init(1.0f);
    minActiveAltitude().init(3.0e6);

    conf.get("url", url());
    conf.get("opacity", opacity());
    conf.get("detail_control", detailControl());
    conf.get("min_active_altitude", minActiveAltitude());
}

//........................................................................

SingleImageLayer::SingleImageLayer() :
    Layer(&_optionsConcrete),
    _inCurrentFrame(false)
{
    //nop
}

SingleImageLayer::SingleImageLayer(const Options& options) :
    Layer(&_optionsConcrete),
    _optionsConcrete(options),
    _inCurrentFrame(false)
{
    //nop
}

void
SingleImageLayer::setResourceContext(ResourceContext* context)
{
    osg::ref_ptr<ResourceContext> current;
    if (_context.lock(current) && current.get() == context)
        return;

    _context = context;
    _resource = nullptr;
    _inCurrentFrame = false;
}

osg::ref_ptr<ResourceContext>
SingleImageLayer::getResourceContext() const
{
    osg::ref_ptr<ResourceContext> context;
    _context.lock(context);
    return context;
}

void
SingleImageLayer::setOpacity(float value)
{
    options().opacity() = osg::clampBetween(value, 0.0f, 1.0f);
}

float
SingleImageLayer::getOpacity() const
{
    return osg::clampBetween(options().opacity().get(), 0.0f, 1.0f);
}

DisplayParameters
SingleImageLayer::getDisplayParameters() const
{
    DisplayParameters params;
    params.opacity = getOpacity();
    params.detailControl = options().detailControl();
    params.minActiveAltitude = options().minActiveAltitude().get();
    return params;
}

Status
SingleImageLayer::openImplementation()
{
    Status parent = Layer::openImplementation();
    if (parent.isError())
        return parent;

    if (!options().url().isSet() || options().url().get().empty())
        return Status(Status::ConfigurationError, "Missing required url");

    return STATUS_OK;
}

Status
SingleImageLayer::prepare(osg::ref_ptr<ResourceContext>& context)
{
    if (!_context.lock(context))
    {
        OW_WARN << LC << "No resource context" << std::endl;
        return Status(Status::ServiceUnavailable, "Layer \"" + getName() + "\" has no resource context");
    }

    if (!isOpen() && open().isError())
        return getStatus();

    if (!_resource.valid())
    {
        const std::string& url = options().url().get();
        _resource = context->getOrCreateResource(url, url);
    }

    return STATUS_OK;
}

Status
SingleImageLayer::prePopulate()
{
    osg::ref_ptr<ResourceContext> context;
    Status status = prepare(context);
    if (status.isError())
        return status;

    ResourceContext::Disposition disposition = context->ensureFetchStarted(
        _resource->getIdentifier(),
        _resource->getLocator(),
        ResourceContext::FETCH_SUPPRESS_NOTIFY);

    if (disposition == ResourceContext::NO_FETCHER)
        return Status(Status::ServiceUnavailable, "Resource context has no fetcher");

    return STATUS_OK;
}

bool
SingleImageLayer::isPrePopulated() const
{
    osg::ref_ptr<ResourceContext> context;
    if (!_context.lock(context) || !_resource.valid())
        return false;

    return context->isReady(_resource->getIdentifier());
}

Result<RenderOutcome>
SingleImageLayer::render(SurfaceRenderer* renderer)
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

    if (context->ensureFetchStarted(_resource->getIdentifier(), _resource->getLocator()) == ResourceContext::NO_FETCHER)
        return Status(Status::ServiceUnavailable, "Resource context has no fetcher");

    if (!context->isReady(_resource->getIdentifier()))
        return RENDER_NOT_READY;

    renderer->drawSurfaceImage(*_resource, getDisplayParameters());
    _inCurrentFrame = true;
    return RENDER_DRAWN;
}
