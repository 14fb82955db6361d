/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/Layer>

using namespace osgWeather;

#define LC "[Layer] \"" << getName() << "\" "

//........................................................................

Config
Layer::Options::getConfig() const
{
    Config conf("layer");
    conf.set("name", name());
    conf.set("enabled", enabled());
    return conf;
}

void
Layer::Options::fromConfig(const Config& conf)
{
    enabled().init(true);

    conf.get("name", name());
    conf.get("enabled", enabled());
}

//........................................................................

Layer::Layer() :
    _options(&_optionsConcrete),
    _status(Status::ResourceUnavailable, "Layer closed")
{
    //nop
}

Layer::Layer(Layer::Options* optionsPtr) :
    _options(optionsPtr ? optionsPtr : &_optionsConcrete),
    _status(Status::ResourceUnavailable, "Layer closed")
{
    //nop
}

const std::string&
Layer::getName() const
{
    return options().name().get();
}

void
Layer::setName(const std::string& value)
{
    options().name() = value;
}

bool
Layer::getEnabled() const
{
    return options().enabled().get();
}

void
Layer::setEnabled(bool value)
{
    options().enabled() = value;
}

const Status&
Layer::open()
{
    if (isOpen())
        return getStatus();

    setStatus(openImplementation());

    if (getStatus().isError())
    {
        OW_WARN << LC << "Failed to open: " << getStatus().message() << std::endl;
    }

    return getStatus();
}

void
Layer::close()
{
    if (isOpen())
    {
        closeImplementation();
        setStatus(Status(Status::ResourceUnavailable, "Layer closed"));
    }
}

bool
Layer::isOpen() const
{
    return getStatus().isOK();
}

Status
Layer::openImplementation()
{
    return STATUS_OK;
}

const Status&
Layer::setStatus(const Status& status)
{
    _status = status;
    return _status;
}
