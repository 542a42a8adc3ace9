#pragma once

#include "core/poco_config_manager.hpp"
#include "core/evidence_extractor.hpp"
#include "core/file_organizer.hpp"
#include "core/scan_coordinator.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * @brief Typed view of the application configuration
 *
 * Delegates storage to PocoConfigManager. Every getter falls back to the
 * built-in default when a key is missing or invalid.
 */
class AppConfig
{
public:
    static AppConfig &getInstance()
    {
        static AppConfig instance;
        return instance;
    }

    /**
     * @brief Load a JSON configuration file
     * @param path Path of the file
     * @return false when the file is missing or invalid; defaults stay in effect
     */
    bool loadFromFile(const std::string &path);

    /**
     * @brief Reset every key to its built-in default
     */
    void initializeDefaultConfig();

    static nlohmann::json defaultConfig();

    nlohmann::json getAll() const;
    void update(const nlohmann::json &patch);

    std::string getLogLevel() const;

    // 0 means one thread per hardware core
    size_t getMaxAnalysisThreads() const;

    OrganizerOptions getOrganizerOptions() const;
    ScanOptions getScanOptions() const;
    ExtractorOptions getExtractorOptions() const;
    std::vector<std::string> getConstrainedPathPatterns() const;

private:
    AppConfig();
    AppConfig(const AppConfig &) = delete;
    AppConfig &operator=(const AppConfig &) = delete;

    std::set<std::string> getExtensionSet(const std::string &key, const std::vector<std::string> &def) const;

    PocoConfigManager &poco_cfg_;
};
