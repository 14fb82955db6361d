/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/ResourceCache>

using namespace osgWeather;

#define LC "[ResourceCache] "

ResourceCache::ResourceCache(std::size_t capacityBytes) :
    _capacity(capacityBytes),
    _usedBytes(0u)
{
    //nop
}

void
ResourceCache::setCapacity(std::size_t capacityBytes, Evicted* evicted)
{
    _capacity = capacityBytes;
    trim(std::string(), evicted);
}

bool
ResourceCache::contains(const std::string& identifier) const
{
    return _map.find(identifier) != _map.end();
}

osg::ref_ptr<ImageResource>
ResourceCache::get(const std::string& identifier)
{
    auto i = _map.find(identifier);
    if (i == _map.end())
        return nullptr;

    // move to the front of the LRU list
    _lru.splice(_lru.begin(), _lru, i->second);
    return i->second->resource;
}

void
ResourceCache::insert(const std::string& identifier, ImageResource* resource, std::size_t sizeBytes, Evicted* evicted)
{
    remove(identifier);

    _lru.push_front(Entry{ identifier, resource, sizeBytes });
    _map[identifier] = _lru.begin();
    _usedBytes += sizeBytes;

    trim(identifier, evicted);
}

bool
ResourceCache::remove(const std::string& identifier)
{
    auto i = _map.find(identifier);
    if (i == _map.end())
        return false;

    _usedBytes -= i->second->sizeBytes;
    _lru.erase(i->second);
    _map.erase(i);
    return true;
}

void
ResourceCache::clear()
{
    _lru.clear();
    _map.clear();
    _usedBytes = 0u;
}

void
ResourceCache::trim(const std::string& keep, Evicted* evicted)
{
    if (_capacity == 0u)
        return;

    while (_usedBytes > _capacity && !_lru.empty())
    {
        Entry& oldest = _lru.back();
        if (oldest.identifier == keep)
            break;

        OW_DEBUG << LC << "Evicting " << oldest.identifier << " (" << oldest.sizeBytes << " bytes)" << std::endl;

        if (evicted)
            evicted->push_back(oldest.resource);

        _usedBytes -= oldest.sizeBytes;
        _map.erase(oldest.identifier);
        _lru.pop_back();
    }
}
