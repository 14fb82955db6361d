/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/Status>

using namespace osgWeather;

#define LC "[Status] "

const osgWeather::Status osgWeather::STATUS_OK;

std::string osgWeather::Status::_codeText[6] = {
    "No error",
    "Resource unavailable",
    "Service unavailable",
    "Configuration error",
    "Assertion failure",
    "Error"
};

const std::string&
Status::codeText() const
{
    unsigned index = (unsigned)_errorCode;
    return _codeText[index < 6u ? index : 5u];
}
