/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/Notify>
#include <osgWeather/Config>
#include <osgWeather/DateTime>
#include <osgWeather/ImageFetcher>
#include <osgWeather/ResourceContext>
#include <osgWeather/SingleImageLayer>
#include <osgWeather/TimeSeriesLayer>
#include <osgWeather/StringUtils>
#include <osg/ArgumentParser>
#include <osg/Timer>
#include <OpenThreads/Thread>
#include <iostream>

#define LC "[osgweather_timeseries] "

using namespace osgWeather;

namespace
{
    int
    usage(const char* name)
    {
        OW_NOTICE
            << "\nUsage: " << name << " [options]"
            << "\n  --config <file.json>       : JSON options file with \"resource_context\","
            << "\n                               \"background\" and \"time_series\" objects"
            << "\n  --root <dir>               : directory that relative paths resolve against"
            << "\n  --base-path <prefix>       : prefix of the time slot images"
            << "\n  --sequence <start/end/P>   : time sequence, e.g. 2016-07-12/2016-07-18/PT3H"
            << "\n  --background <url>         : background image drawn under the time series"
            << "\n  --time <iso8601>           : draw only the slot nearest to this time"
            << "\n  --threads <n>              : number of fetch threads (default 4)"
            << "\n  --wait <seconds>           : how long to wait for prefetching (default 30)"
            << std::endl;
        return 0;
    }

    int
    quit(const std::string& msg)
    {
        OW_WARN << LC << msg << std::endl;
        return -1;
    }

    // Stands in for the globe renderer; reports what would be drawn.
    struct LoggingRenderer : public SurfaceRenderer
    {
        void drawSurfaceImage(const ImageResource& resource, const DisplayParameters& params) override
        {
            const osg::Image* image = resource.getImage();

            Util::Stringify buf;
            buf << "Drawing " << resource.getIdentifier()
                << " (" << (image ? image->s() : 0) << "x" << (image ? image->t() : 0) << ")"
                << " opacity=" << params.opacity;
            if (params.detailControl.isSet())
                buf << " detail=" << params.detailControl.get();

            OW_NOTICE << LC << (std::string)buf << std::endl;
        }
    };

    const char* outcomeText(RenderOutcome outcome)
    {
        return
            outcome == RENDER_DRAWN ? "drawn" :
            outcome == RENDER_NOT_READY ? "not ready" :
            "skipped";
    }
}

int
main(int argc, char** argv)
{
    osg::ArgumentParser arguments(&argc, argv);

    if (arguments.read("--help") || arguments.read("-h"))
        return usage(argv[0]);

    Config conf;
    std::string configFile;
    if (arguments.read("--config", configFile))
    {
        if (!conf.fromFile(configFile))
            return quit("Failed to read options from \"" + configFile + "\"");
    }

    TimeSeriesLayer::Options seriesOptions(conf.child("time_series"));
    SingleImageLayer::Options backgroundOptions(conf.child("background"));
    ResourceContext::Options contextOptions(conf.child("resource_context"));

    std::string value;
    if (arguments.read("--base-path", value))
        seriesOptions.basePath() = value;
    if (arguments.read("--sequence", value))
        seriesOptions.sequence() = value;
    if (arguments.read("--background", value))
        backgroundOptions.url() = value;

    std::string root;
    arguments.read("--root", root);

    unsigned numThreads = 4u;
    arguments.read("--threads", numThreads);

    double waitSeconds = 30.0;
    arguments.read("--wait", waitSeconds);

    std::string timeString;
    arguments.read("--time", timeString);

    if (arguments.errors())
    {
        arguments.writeErrorMessages(std::cout);
        return -1;
    }

    osg::ref_ptr<ResourceContext> context = new ResourceContext(
        new FileFetcher(root, numThreads),
        contextOptions);

    context->setRedrawCallback([](const std::string& identifier)
    {
        OW_INFO << LC << "Redraw requested: " << identifier << " arrived" << std::endl;
    });

    osg::ref_ptr<SingleImageLayer> background;
    if (backgroundOptions.url().isSet())
    {
        background = new SingleImageLayer(backgroundOptions);
        background->setResourceContext(context.get());

        Status status = background->prePopulate();
        if (status.isError())
            return quit("Background: " + status.toString());
    }

    osg::ref_ptr<TimeSeriesLayer> series = new TimeSeriesLayer(seriesOptions);
    series->setResourceContext(context.get());

    // hidden until every slot is in memory, so the animation does not
    // show images arriving one by one
    series->setEnabled(false);

    Status status = series->prePopulate();
    if (status.isError())
        return quit("Time series: " + status.toString());

    OW_NOTICE << LC << "Prefetching " << series->getTimeSlotIndex().size() << " slots of "
        << series->getSequence().toString() << std::endl;

    const osg::Timer_t start = osg::Timer::instance()->tick();
    while (!series->isPrePopulated() || (background.valid() && !background->isPrePopulated()))
    {
        context->update();

        if (osg::Timer::instance()->delta_s(start, osg::Timer::instance()->tick()) > waitSeconds)
        {
            OW_WARN << LC << "Prefetch incomplete after " << waitSeconds << "s ("
                << context->getNumInFlight() << " in flight, "
                << context->getAbsentResources().size() << " failed); showing what we have" << std::endl;
            break;
        }

        OpenThreads::Thread::microSleep(20000);
    }

    series->setEnabled(true);

    LoggingRenderer renderer;

    std::vector<TimeStamp> times;
    if (!timeString.empty())
    {
        DateTime t(timeString);
        if (!t.isValid())
            return quit("Invalid time \"" + timeString + "\"");
        times.push_back(t.asTimeStamp());
    }
    else
    {
        times = series->getAvailableTimes();
    }

    for (auto t : times)
    {
        context->update();

        series->setTime(DateTime(t));

        if (background.valid())
        {
            Result<RenderOutcome> r = background->render(&renderer);
            if (!r.ok())
                OW_WARN << LC << "Background: " << r.status().toString() << std::endl;
        }

        Result<RenderOutcome> r = series->render(&renderer);
        if (!r.ok())
        {
            OW_WARN << LC << DateTime(t).asISO8601() << ": " << r.status().toString() << std::endl;
            continue;
        }

        OW_NOTICE << LC << DateTime(t).asISO8601() << " -> slot "
            << (r.value() == RENDER_DRAWN ? series->getLastRenderedKey() : std::string("--"))
            << " (" << outcomeText(r.value()) << ")" << std::endl;
    }

    return 0;
}
