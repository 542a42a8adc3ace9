#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

// Writes a JSON tree as dotted keys; arrays are kept as their JSON text
static void flattenInto(JSONConfiguration &cfg, const std::string &prefix, const nlohmann::json &node)
{
    switch (node.type())
    {
    case nlohmann::json::value_t::object:
        for (const auto &item : node.items())
            flattenInto(cfg, prefix.empty() ? item.key() : prefix + "." + item.key(), item.value());
        break;
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
        break;
    case nlohmann::json::value_t::boolean:
        cfg.setBool(prefix, node.get<bool>());
        break;
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
        cfg.setInt64(prefix, node.get<std::int64_t>());
        break;
    case nlohmann::json::value_t::number_float:
        cfg.setDouble(prefix, node.get<double>());
        break;
    case nlohmann::json::value_t::string:
        cfg.setString(prefix, node.get<std::string>());
        break;
    default:
        cfg.setString(prefix, node.dump());
        break;
    }
}

PocoConfigManager::PocoConfigManager()
    : cfg_(new JSONConfiguration())
{
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
        return false;

    AutoPtr<JSONConfiguration> loaded(new JSONConfiguration());
    try
    {
        loaded->load(in);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Invalid configuration file " + path + ": " + e.displayText());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = loaded;
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_->save(out);
    return out.good();
}

void PocoConfigManager::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::ostringstream text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_->save(text);
    }
    return nlohmann::json::parse(text.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    flattenInto(*cfg_, "", patch);
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Config key " + key + " is not an integer (" + e.displayText() + "), using " + std::to_string(def));
        return def;
    }
}

std::int64_t PocoConfigManager::getInt64(const std::string &key, std::int64_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt64(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Config key " + key + " is not an integer (" + e.displayText() + "), using " + std::to_string(def));
        return def;
    }
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Config key " + key + " is not a boolean (" + e.displayText() + "), using default");
        return def;
    }
}

std::vector<std::string> PocoConfigManager::getStringList(const std::string &key,
                                                          const std::vector<std::string> &def) const
{
    nlohmann::json node = getAll();
    std::istringstream segments(key);
    std::string segment;
    while (std::getline(segments, segment, '.'))
    {
        if (!node.is_object() || !node.contains(segment))
            return def;
        node = node[segment];
    }

    if (node.is_string())
    {
        node = nlohmann::json::parse(node.get<std::string>(), nullptr, false);
        if (node.is_discarded())
            return def;
    }
    if (!node.is_array())
        return def;

    std::vector<std::string> values;
    for (const auto &item : node)
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}
