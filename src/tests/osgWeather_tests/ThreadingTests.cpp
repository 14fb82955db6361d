/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <catch2/catch.hpp>
#include <osgWeather/Threading>
#include <osgWeather/ImageFetcher>
#include <cstdio>
#include <fstream>

using namespace osgWeather;
using namespace osgWeather::Threading;

TEST_CASE("Future") {

    SECTION("Resolved promise is available") {
        Promise<int> promise;
        Future<int> future = promise;
        REQUIRE_FALSE(future.available());
        REQUIRE_FALSE(future.empty());

        promise.resolve(7);
        REQUIRE(future.available());
        REQUIRE(future.value() == 7);
    }

    SECTION("Dropped promise leaves the future empty") {
        Future<int> future;
        {
            Promise<int> promise;
            future = promise;
            REQUIRE_FALSE(future.empty());
        }
        REQUIRE_FALSE(future.available());
        REQUIRE(future.empty());
    }

    SECTION("Dropped future cancels the promise") {
        Promise<int> promise;
        {
            Future<int> future = promise;
            REQUIRE_FALSE(promise.canceled());
        }
        REQUIRE(promise.canceled());
    }
}

TEST_CASE("FileFetcher") {
    const std::string path = "osgweather_filefetcher_test.bin";
    {
        std::ofstream out(path.c_str(), std::ios::binary);
        out << "PAYLOAD";
    }

    osg::ref_ptr<FileFetcher> fetcher = new FileFetcher("", 2u);
    REQUIRE(jobs::get_pool(FETCH_POOL_NAME)->concurrency() >= 2u);

    SECTION("Reads a file") {
        Future<FetchResult> future = fetcher->fetch(path);
        FetchResult result = future.join();
        REQUIRE(future.available());
        REQUIRE(result.status.isOK());
        REQUIRE(result.payload == "PAYLOAD");
    }

    SECTION("Missing file") {
        Future<FetchResult> future = fetcher->fetch("no/such/file.png");
        FetchResult result = future.join();
        REQUIRE(future.available());
        REQUIRE(result.status.code() == Status::ResourceUnavailable);
        REQUIRE(result.payload.empty());
    }

    SECTION("Many files at once") {
        std::vector<Future<FetchResult>> futures;
        for (int i = 0; i < 16; ++i)
            futures.push_back(fetcher->fetch(path));

        for (auto& future : futures)
            REQUIRE(future.join().payload == "PAYLOAD");
    }

    SECTION("Empty file") {
        const std::string empty = "osgweather_filefetcher_empty.bin";
        {
            std::ofstream out(empty.c_str(), std::ios::binary);
        }
        FetchResult result = FileFetcher::readFile(empty);
        REQUIRE(result.status.isError());
        std::remove(empty.c_str());
    }

    std::remove(path.c_str());
}
