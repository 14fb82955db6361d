/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/ImageDecoder>
#include <osgDB/FileNameUtils>
#include <osgDB/Registry>
#include <cstring>
#include <sstream>

using namespace osgWeather;

#define LC "[ReaderWriterDecoder] "

ReaderWriterDecoder::ReaderWriterDecoder(const osgDB::Options* options) :
    _options(options)
{
    //nop
}

osgDB::ReaderWriter*
ReaderWriterDecoder::getReaderWriterForPayload(const std::string& payload)
{
    if (payload.size() < 8)
        return nullptr;

    const char* data = payload.data();
    osgDB::Registry* registry = osgDB::Registry::instance();

    // .jpg:  FF D8 FF
    // .png:  89 50 4E 47 0D 0A 1A 0A
    // .gif:  GIF87a / GIF89a
    // .tiff: 49 49 2A 00 / 4D 4D 00 2A
    // .bmp:  BM
    if (!memcmp(data, "\xFF\xD8\xFF", 3))
        return registry->getReaderWriterForExtension("jpg");
    if (!memcmp(data, "\x89\x50\x4E\x47\x0D\x0A\x1A\x0A", 8))
        return registry->getReaderWriterForExtension("png");
    if (!memcmp(data, "GIF87a", 6) || !memcmp(data, "GIF89a", 6))
        return registry->getReaderWriterForExtension("gif");
    if (!memcmp(data, "\x49\x49\x2A\x00", 4) || !memcmp(data, "\x4D\x4D\x00\x2A", 4))
        return registry->getReaderWriterForExtension("tif");
    if (data[0] == 'B' && data[1] == 'M')
        return registry->getReaderWriterForExtension("bmp");

    return nullptr;
}

Result<osg::ref_ptr<osg::Image>>
ReaderWriterDecoder::decode(const std::string& payload, const std::string& locator) const
{
    std::string ext = osgDB::getLowerCaseFileExtension(locator);

    osgDB::ReaderWriter* rw = nullptr;
    if (!ext.empty())
        rw = osgDB::Registry::instance()->getReaderWriterForExtension(ext);

    if (!rw)
        rw = getReaderWriterForPayload(payload);

    if (!rw)
    {
        return Status(Status::ResourceUnavailable, "No image plugin for \"" + locator + "\"");
    }

    std::istringstream in(payload);
    osgDB::ReaderWriter::ReadResult rr = rw->readImage(in, _options.get());

    if (!rr.validImage())
    {
        std::string reason = rr.message().empty() ? rr.statusMessage() : rr.message();
        return Status(Status::ResourceUnavailable, "Failed to decode \"" + locator + "\": " + reason);
    }

    osg::ref_ptr<osg::Image> image = rr.takeImage();
    image->setFileName(locator);
    return image;
}
