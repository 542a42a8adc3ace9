#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Thread-safe holder of the JSON configuration document
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    /**
     * @brief Replace the current configuration with a JSON file
     * @return false if the file is missing or is not valid JSON
     */
    bool load(const std::string &path);
    bool save(const std::string &path) const;

    /**
     * @brief Drop every value, leaving an empty configuration
     */
    void clear();

    nlohmann::json getAll() const;
    void update(const nlohmann::json &patch);

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    std::int64_t getInt64(const std::string &key, std::int64_t def) const;
    bool getBool(const std::string &key, bool def) const;

    /**
     * @brief Read a dotted key holding an array of strings
     *
     * Accepts a native JSON array or a string containing one.
     */
    std::vector<std::string> getStringList(const std::string &key, const std::vector<std::string> &def) const;

private:
    PocoConfigManager();
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
