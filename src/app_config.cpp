#include "core/app_config.hpp"
#include "core/thread_pool_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>

AppConfig::AppConfig()
    : poco_cfg_(PocoConfigManager::getInstance())
{
    initializeDefaultConfig();
}

nlohmann::json AppConfig::defaultConfig()
{
    return {
        {"log_level", "INFO"},
        {"threading", {{"max_analysis_threads", 0}}},
        {"organization",
         {{"folder_name", "tiktok_detection"},
          {"cache_file_name", "not_tiktok.json"},
          {"phone_cache_file_name", "tiktok_phone_cache.json"},
          {"scratch_dir", ""},
          {"max_conflict_attempts", 999}}},
        {"mounts", {{"constrained_path_patterns", nlohmann::json::array({"gvfs/mtp", "run/user"})}}},
        {"media",
         {{"photo_extensions", nlohmann::json::array({"jpg", "jpeg", "png", "webp", "gif", "bmp"})},
          {"video_extensions", nlohmann::json::array({"mp4", "mov", "avi", "mkv", "flv", "webm"})}}},
        {"analysis",
         {{"max_decode_bytes", 64 * 1024 * 1024},
          {"compute_content_hash", false}}}};
}

void AppConfig::initializeDefaultConfig()
{
    poco_cfg_.clear();
    poco_cfg_.update(defaultConfig());
}

bool AppConfig::loadFromFile(const std::string &path)
{
    nlohmann::json defaults = defaultConfig();
    if (!poco_cfg_.load(path))
    {
        Logger::info("No usable configuration at " + path + ", using defaults");
        initializeDefaultConfig();
        return false;
    }

    // Keys absent from the file keep their defaults
    nlohmann::json loaded = poco_cfg_.getAll();
    defaults.merge_patch(loaded);
    poco_cfg_.clear();
    poco_cfg_.update(defaults);
    Logger::info("Configuration loaded from " + path);
    return true;
}

nlohmann::json AppConfig::getAll() const
{
    return poco_cfg_.getAll();
}

void AppConfig::update(const nlohmann::json &patch)
{
    poco_cfg_.update(patch);
}

std::string AppConfig::getLogLevel() const
{
    std::string level = poco_cfg_.getString("log_level", "INFO");
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::toupper(c)); });
    if (!Logger::isValidLevel(level))
    {
        Logger::warn("Invalid log_level '" + level + "' in configuration, using INFO");
        return "INFO";
    }
    return level;
}

size_t AppConfig::getMaxAnalysisThreads() const
{
    int threads = poco_cfg_.getInt("threading.max_analysis_threads", 0);
    if (threads < 0 || static_cast<size_t>(threads) > ThreadPoolManager::getMaxAllowedThreadCount())
    {
        Logger::warn("threading.max_analysis_threads out of range (" + std::to_string(threads) + "), using hardware concurrency");
        return 0;
    }
    return static_cast<size_t>(threads);
}

OrganizerOptions AppConfig::getOrganizerOptions() const
{
    OrganizerOptions options;
    options.folder_name = poco_cfg_.getString("organization.folder_name", options.folder_name);
    options.cache_file_name = poco_cfg_.getString("organization.cache_file_name", options.cache_file_name);
    options.phone_cache_file_name = poco_cfg_.getString("organization.phone_cache_file_name", options.phone_cache_file_name);
    options.scratch_dir = poco_cfg_.getString("organization.scratch_dir", "");

    int attempts = poco_cfg_.getInt("organization.max_conflict_attempts", options.max_conflict_attempts);
    if (attempts < 1)
    {
        Logger::warn("organization.max_conflict_attempts must be positive, using " +
                     std::to_string(options.max_conflict_attempts));
    }
    else
    {
        options.max_conflict_attempts = attempts;
    }

    if (options.folder_name.empty() || options.folder_name.find('/') != std::string::npos)
    {
        Logger::warn("Invalid organization.folder_name, using tiktok_detection");
        options.folder_name = "tiktok_detection";
    }
    return options;
}

std::set<std::string> AppConfig::getExtensionSet(const std::string &key, const std::vector<std::string> &def) const
{
    std::set<std::string> extensions;
    for (std::string ext : poco_cfg_.getStringList(key, def))
    {
        if (!ext.empty() && ext[0] == '.')
            ext = ext.substr(1);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (!ext.empty())
            extensions.insert(ext);
    }
    return extensions;
}

ScanOptions AppConfig::getScanOptions() const
{
    ScanOptions options;
    options.photo_extensions = getExtensionSet("media.photo_extensions",
                                               std::vector<std::string>(options.photo_extensions.begin(), options.photo_extensions.end()));
    options.video_extensions = getExtensionSet("media.video_extensions",
                                               std::vector<std::string>(options.video_extensions.begin(), options.video_extensions.end()));
    return options;
}

ExtractorOptions AppConfig::getExtractorOptions() const
{
    ExtractorOptions options;
    std::int64_t max_decode = poco_cfg_.getInt64("analysis.max_decode_bytes", static_cast<std::int64_t>(options.max_decode_bytes));
    if (max_decode < 0)
        Logger::warn("analysis.max_decode_bytes must not be negative, using default");
    else
        options.max_decode_bytes = static_cast<size_t>(max_decode);
    options.compute_content_hash = poco_cfg_.getBool("analysis.compute_content_hash", false);
    options.container_extensions = getScanOptions().video_extensions;
    return options;
}

std::vector<std::string> AppConfig::getConstrainedPathPatterns() const
{
    return poco_cfg_.getStringList("mounts.constrained_path_patterns", {"gvfs/mtp", "run/user"});
}
