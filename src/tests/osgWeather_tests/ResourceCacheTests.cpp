/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <catch2/catch.hpp>
#include <osgWeather/ResourceCache>

using namespace osgWeather;

namespace
{
    ImageResource* make(const std::string& id)
    {
        return new ImageResource(id, id);
    }
}

TEST_CASE("ResourceCache") {

    SECTION("Unbounded") {
        ResourceCache cache;
        cache.insert("a", make("a"), 10u);
        cache.insert("b", make("b"), 10u);

        REQUIRE(cache.contains("a"));
        REQUIRE(cache.contains("b"));
        REQUIRE_FALSE(cache.contains("c"));
        REQUIRE(cache.size() == 2u);
        REQUIRE(cache.getUsedBytes() == 20u);
        REQUIRE(cache.get("a")->getIdentifier() == "a");
        REQUIRE_FALSE(cache.get("c").valid());
    }

    SECTION("Replace and remove") {
        ResourceCache cache;
        cache.insert("a", make("a"), 10u);
        cache.insert("a", make("a"), 15u);
        REQUIRE(cache.size() == 1u);
        REQUIRE(cache.getUsedBytes() == 15u);

        REQUIRE(cache.remove("a"));
        REQUIRE_FALSE(cache.remove("a"));
        REQUIRE(cache.getUsedBytes() == 0u);
    }

    SECTION("Evicts least recently used") {
        ResourceCache cache(25u);
        ResourceCache::Evicted evicted;

        cache.insert("a", make("a"), 10u, &evicted);
        cache.insert("b", make("b"), 10u, &evicted);
        REQUIRE(evicted.empty());

        cache.insert("c", make("c"), 10u, &evicted);
        REQUIRE(evicted.size() == 1u);
        REQUIRE(evicted[0]->getIdentifier() == "a");
        REQUIRE_FALSE(cache.contains("a"));
        REQUIRE(cache.getUsedBytes() == 20u);
    }

    SECTION("Access refreshes an entry") {
        ResourceCache cache(25u);
        ResourceCache::Evicted evicted;

        cache.insert("a", make("a"), 10u);
        cache.insert("b", make("b"), 10u);
        REQUIRE(cache.get("a").valid());

        cache.insert("c", make("c"), 10u, &evicted);
        REQUIRE(evicted.size() == 1u);
        REQUIRE(evicted[0]->getIdentifier() == "b");
        REQUIRE(cache.contains("a"));
    }

    SECTION("Oversized entry is kept") {
        ResourceCache cache(5u);
        cache.insert("big", make("big"), 10u);
        REQUIRE(cache.contains("big"));
        REQUIRE(cache.size() == 1u);
    }

    SECTION("Shrinking the capacity") {
        ResourceCache cache;
        cache.insert("a", make("a"), 10u);
        cache.insert("b", make("b"), 10u);
        ResourceCache::Evicted evicted;
        cache.setCapacity(10u, &evicted);
        REQUIRE(cache.size() == 1u);
        REQUIRE(cache.contains("b"));
        REQUIRE(cache.getUsedBytes() == 10u);
        REQUIRE(evicted.size() == 1u);
        REQUIRE(evicted.front()->getIdentifier() == "a");
    }
}
