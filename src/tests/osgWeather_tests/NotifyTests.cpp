/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <catch2/catch.hpp>
#include <osgWeather/Notify>
#include <vector>

using namespace osgWeather;

namespace
{
    class CaptureHandler : public osg::NotifyHandler
    {
    public:
        void notify(osg::NotifySeverity severity, const char* message) override
        {
            severities.push_back(severity);
            messages.push_back(message);
        }

        std::vector<osg::NotifySeverity> severities;
        std::vector<std::string> messages;
    };
}

TEST_CASE("Notify") {

    osg::ref_ptr<osg::NotifyHandler> savedHandler = getNotifyHandler();
    osg::NotifySeverity savedLevel = getNotifyLevel();

    osg::ref_ptr<CaptureHandler> capture = new CaptureHandler();
    setNotifyHandler(capture.get());
    setNotifyLevel(osg::WARN);

    SECTION("Messages at or above the level reach the handler") {
        OW_WARN << "[Test] " << "fetch failed" << std::endl;
        REQUIRE(capture->messages.size() == 1u);
        REQUIRE(capture->severities.front() == osg::WARN);
        REQUIRE(capture->messages.front().find("[osgWeather]* [Test] fetch failed") == 0u);
    }

    SECTION("Messages below the level are dropped") {
        OW_INFO << "quiet" << std::endl;
        OW_DEBUG << "quieter" << std::endl;
        REQUIRE(capture->messages.empty());
        REQUIRE_FALSE(isNotifyEnabled(osg::INFO));
        REQUIRE(isNotifyEnabled(osg::FATAL));
    }

    SECTION("Raising the level lets more through") {
        setNotifyLevel(osg::INFO);
        OW_INFO << "loud" << std::endl;
        REQUIRE(capture->messages.size() == 1u);
        REQUIRE(capture->severities.front() == osg::INFO);
    }

    setNotifyHandler(savedHandler.get());
    setNotifyLevel(savedLevel);
}
