/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/Notify>

#include <osg/ApplicationUsage>
#include <osg/ref_ptr>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>

using namespace osgWeather;

namespace
{
    // Swallows everything written to it; returned for disabled severities.
    class DiscardBuffer : public std::streambuf
    {
    protected:
        std::streamsize xsputn(const char*, std::streamsize n) override
        {
            return n;
        }

        int_type overflow(int_type c) override
        {
            return traits_type::not_eof(c);
        }
    };

    // Collects one message and hands it to the notify handler on sync()
    // (std::endl or std::flush). The severity of the pending message is
    // tracked so that a severity change flushes what came before it.
    class HandlerBuffer : public std::stringbuf
    {
    public:
        HandlerBuffer() : _severity(osg::NOTICE)
        {
            // preallocate so that ordinary messages never grow the buffer
            str(std::string(4095, '\0'));
            pubseekpos(0, std::ios_base::out);
        }

        void setHandler(osg::NotifyHandler* handler) { _handler = handler; }
        osg::NotifyHandler* getHandler() const { return _handler.get(); }

        void setSeverity(osg::NotifySeverity severity)
        {
            if (severity != _severity)
            {
                sync();
                _severity = severity;
            }
        }

    protected:
        int sync() override
        {
            sputc('\0');
            if (_handler.valid())
                _handler->notify(_severity, pbase());
            pubseekpos(0, std::ios_base::out);
            return 0;
        }

    private:
        osg::ref_ptr<osg::NotifyHandler> _handler;
        osg::NotifySeverity _severity;
    };

    struct NotifyState
    {
        NotifyState() :
            level(osg::NOTICE),
            discard(&discardBuffer),
            stream(&handlerBuffer)
        {
            const char* env = ::getenv("OSGWEATHER_NOTIFY_LEVEL");
            if (env)
            {
                std::string value(env);
                std::transform(value.begin(), value.end(), value.begin(), ::toupper);

                // order matters: DEBUG_INFO and DEBUG_FP before DEBUG
                static const std::pair<const char*, osg::NotifySeverity> table[] = {
                    { "ALWAYS",     osg::ALWAYS },
                    { "FATAL",      osg::FATAL },
                    { "WARN",       osg::WARN },
                    { "NOTICE",     osg::NOTICE },
                    { "DEBUG_INFO", osg::DEBUG_INFO },
                    { "DEBUG_FP",   osg::DEBUG_FP },
                    { "DEBUG",      osg::DEBUG_INFO },
                    { "INFO",       osg::INFO }
                };

                bool found = false;
                for (auto& entry : table)
                {
                    if (value.find(entry.first) != std::string::npos)
                    {
                        level = entry.second;
                        found = true;
                        break;
                    }
                }

                if (!found)
                {
                    std::cout << "Warning: invalid OSGWEATHER_NOTIFY_LEVEL set (" << value << ")" << std::endl;
                }
            }

            handlerBuffer.setHandler(new osg::StandardNotifyHandler());
        }

        osg::NotifySeverity level;
        DiscardBuffer discardBuffer;
        HandlerBuffer handlerBuffer;
        std::ostream discard;
        std::ostream stream;
    };

    NotifyState& state()
    {
        static NotifyState s_state;
        return s_state;
    }

    // Forces initialization during static init so the environment is read once.
    struct NotifyInitProxy
    {
        NotifyInitProxy() { osgWeather::initNotifyLevel(); }
    };
    NotifyInitProxy s_notifyInitProxy;

    osg::ApplicationUsageProxy s_notifyUsage(
        osg::ApplicationUsage::ENVIRONMENTAL_VARIABLE,
        "OSGWEATHER_NOTIFY_LEVEL <mode>",
        "FATAL | WARN | NOTICE | DEBUG_INFO | DEBUG_FP | DEBUG | INFO | ALWAYS");
}

bool
osgWeather::initNotifyLevel()
{
    state();
    return true;
}

void
osgWeather::setNotifyLevel(osg::NotifySeverity severity)
{
    state().level = severity;
}

osg::NotifySeverity
osgWeather::getNotifyLevel()
{
    return state().level;
}

bool
osgWeather::isNotifyEnabled(osg::NotifySeverity severity)
{
    return severity <= state().level;
}

void
osgWeather::setNotifyHandler(osg::NotifyHandler* handler)
{
    state().handlerBuffer.setHandler(handler);
}

osg::NotifyHandler*
osgWeather::getNotifyHandler()
{
    return state().handlerBuffer.getHandler();
}

std::ostream&
osgWeather::notify(const osg::NotifySeverity severity)
{
    NotifyState& s = state();
    if (isNotifyEnabled(severity))
    {
        s.handlerBuffer.setSeverity(severity);
        return s.stream;
    }
    return s.discard;
}
