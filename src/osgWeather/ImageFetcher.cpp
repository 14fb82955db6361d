/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/ImageFetcher>
#include <osgDB/FileNameUtils>
#include <osgDB/fstream>
#include <iterator>

using namespace osgWeather;
using namespace osgWeather::Threading;

#define LC "[FileFetcher] "

FileFetcher::FileFetcher(const std::string& rootDir, unsigned numThreads) :
    _rootDir(rootDir)
{
    _pool = jobs::get_pool(FETCH_POOL_NAME, numThreads);
    if (numThreads > _pool->concurrency())
        _pool->set_concurrency(numThreads);
}

std::string
FileFetcher::resolve(const std::string& locator) const
{
    if (_rootDir.empty() || osgDB::isAbsolutePath(locator))
        return locator;
    return osgDB::concatPaths(_rootDir, locator);
}

FetchResult
FileFetcher::readFile(const std::string& path)
{
    FetchResult result;

    osgDB::ifstream in(path.c_str(), std::ios::binary);
    if (!in.is_open())
    {
        result.status = Status(Status::ResourceUnavailable, "Cannot open \"" + path + "\"");
        return result;
    }

    result.payload.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        result.status = Status(Status::ResourceUnavailable, "Error reading \"" + path + "\"");
        result.payload.clear();
    }
    else if (result.payload.empty())
    {
        result.status = Status(Status::ResourceUnavailable, "\"" + path + "\" is empty");
    }

    return result;
}

Future<FetchResult>
FileFetcher::fetch(const std::string& locator)
{
    std::string path = resolve(locator);

    jobs::context c;
    c.name = locator;
    c.pool = _pool;

    auto task = [path](Cancelable& cancelable)
    {
        FetchResult result;
        if (cancelable.canceled())
        {
            // nobody is waiting; skip the read
            result.status = Status(Status::ResourceUnavailable, "Fetch of \"" + path + "\" canceled");
            return result;
        }
        return readFile(path);
    };

    return jobs::dispatch(task, c);
}
