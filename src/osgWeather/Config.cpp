/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/Config>
#include <osgWeather/Notify>
#include <osgDB/fstream>
#include <json/json.h>
#include <iterator>
#include <memory>

using namespace osgWeather;
using namespace osgWeather::Util;

#define LC "[Config] "

namespace
{
    bool keys_equal(const std::string& a, const std::string& b)
    {
        return ciEquals(a, b);
    }

    Json::Value conf2json(const Config& conf)
    {
        if (conf.children().empty())
        {
            return Json::Value(conf.value());
        }

        Json::Value value(Json::objectValue);

        for (auto& c : conf.children())
        {
            if (c.key().empty())
                continue;

            Json::Value child = conf2json(c);

            // repeated keys become an array
            if (value.isMember(c.key()))
            {
                Json::Value& existing = value[c.key()];
                if (!existing.isArray())
                {
                    Json::Value array(Json::arrayValue);
                    array.append(existing);
                    existing = array;
                }
                existing.append(child);
            }
            else
            {
                value[c.key()] = child;
            }
        }

        return value;
    }

    void json2conf(const Json::Value& json, Config& conf)
    {
        if (json.isObject())
        {
            for (auto& name : json.getMemberNames())
            {
                const Json::Value& value = json[name];

                if (value.isArray())
                {
                    for (auto& element : value)
                    {
                        Config child(name);
                        json2conf(element, child);
                        conf.add(child);
                    }
                }
                else
                {
                    Config child(name);
                    json2conf(value, child);
                    conf.add(child);
                }
            }
        }
        else if (json.isBool())
        {
            conf.setValue(json.asBool() ? "true" : "false");
        }
        else if (!json.isNull())
        {
            conf.setValue(json.asString());
        }
    }
}

const Config&
Config::child(const std::string& key) const
{
    const Config* c = child_ptr(key);
    if (c)
        return *c;

    static Config s_emptyConf;
    return s_emptyConf;
}

const Config*
Config::child_ptr(const std::string& key) const
{
    for (auto& c : _children)
    {
        if (keys_equal(c.key(), key))
            return &c;
    }
    return nullptr;
}

void
Config::remove(const std::string& key)
{
    for (ConfigSet::iterator i = _children.begin(); i != _children.end(); )
    {
        if (keys_equal(i->key(), key))
            i = _children.erase(i);
        else
            ++i;
    }
}

void
Config::merge(const Config& rhs)
{
    // remove matching keys first so that multi-key values replace wholesale
    for (auto& c : rhs._children)
        remove(c.key());

    for (auto& c : rhs._children)
        add(c);
}

std::string
Config::toJSON(bool pretty) const
{
    Json::Value root = conf2json(*this);
    if (!root.isObject())
    {
        // a simple value still serializes as an object
        root = Json::Value(Json::objectValue);
        if (!_key.empty())
            root[_key] = _value;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, root);
}

bool
Config::fromJSON(const std::string& input)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(input.data(), input.data() + input.size(), &root, &errors))
    {
        OW_WARN << LC << "JSON decoding error: " << errors << std::endl;
        return false;
    }

    json2conf(root, *this);
    return true;
}

bool
Config::fromFile(const std::string& path)
{
    osgDB::ifstream in(path.c_str());
    if (!in.is_open())
    {
        OW_WARN << LC << "Cannot open \"" << path << "\"" << std::endl;
        return false;
    }

    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return fromJSON(data);
}

Config
Config::readJSON(const std::string& json)
{
    Config conf;
    conf.fromJSON(json);
    return conf;
}
