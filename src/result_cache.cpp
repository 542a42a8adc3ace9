#include "core/result_cache.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <fstream>

using json = nlohmann::json;

ResultCache::ResultCache()
    : last_updated_(FileUtils::currentTimestamp()), version_(CACHE_VERSION)
{
}

std::string ResultCache::normalizeKey(const std::string &path)
{
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(path), ec);
    if (ec)
        return fs::path(path).lexically_normal().string();
    return absolute.lexically_normal().string();
}

ResultCache ResultCache::load(const std::string &location)
{
    std::error_code ec;
    if (!fs::exists(location, ec))
    {
        Logger::info("No result cache at " + location + ", starting fresh");
        return ResultCache();
    }

    std::ifstream in(location);
    if (!in.is_open())
    {
        Logger::warn("Result cache at " + location + " is unreadable, starting fresh");
        ResultCache fresh;
        fresh.recovered_from_corruption_ = true;
        return fresh;
    }

    try
    {
        json doc = json::parse(in);
        if (doc.is_object())
            return fromJson(doc, location);
        Logger::warn("Result cache at " + location + " is not a JSON object, starting fresh");
    }
    catch (const json::exception &e)
    {
        Logger::warn("Result cache at " + location + " is corrupt (" + e.what() + "), starting fresh");
        ResultCache fresh;
        fresh.recovered_from_corruption_ = true;
        return fresh;
    }

    ResultCache fresh;
    fresh.recovered_from_corruption_ = true;
    return fresh;
}

// nullopt when a field is missing or has the wrong type
static std::optional<CacheEntry> entryFromJson(const json &value)
{
    if (!value.is_object())
        return std::nullopt;

    auto size = value.find("size");
    auto modified = value.find("modified");
    if (size == value.end() || !size->is_number_unsigned() || modified == value.end() || !modified->is_string())
        return std::nullopt;

    CacheEntry entry;
    entry.size = size->get<uint64_t>();
    entry.modified = modified->get<std::string>();

    auto confidence = value.find("confidence");
    if (confidence != value.end())
    {
        if (!confidence->is_number_integer())
            return std::nullopt;
        entry.confidence = confidence->get<int>();
    }

    // Documents written by older tools use "is_tiktok"
    auto match = value.find("is_match");
    if (match == value.end())
        match = value.find("is_tiktok");
    if (match != value.end())
    {
        if (!match->is_boolean())
            return std::nullopt;
        entry.is_match = match->get<bool>();
    }
    return entry;
}

ResultCache ResultCache::fromJson(const json &doc, const std::string &location)
{
    ResultCache cache;

    if (doc.contains("scanned_files") && doc["scanned_files"].is_array())
    {
        for (const auto &path : doc["scanned_files"])
        {
            if (path.is_string())
                cache.scanned_files_.push_back(path.get<std::string>());
        }
    }

    if (doc.contains("last_updated") && doc["last_updated"].is_string())
        cache.last_updated_ = doc["last_updated"].get<std::string>();

    if (!doc.contains("file_metadata") && !doc.contains("cache_version"))
    {
        Logger::info("Migrating legacy result cache at " + location + " (" +
                     std::to_string(cache.scanned_files_.size()) + " paths, no metadata)");
        return cache;
    }

    if (doc.contains("cache_version") && doc["cache_version"].is_string())
    {
        std::string stored = doc["cache_version"].get<std::string>();
        if (stored != CACHE_VERSION)
            Logger::info("Result cache version " + stored + " read as " + CACHE_VERSION);
    }

    if (doc.contains("file_metadata") && doc["file_metadata"].is_object())
    {
        for (auto it = doc["file_metadata"].begin(); it != doc["file_metadata"].end(); ++it)
        {
            auto entry = entryFromJson(it.value());
            if (!entry)
            {
                Logger::warn("Ignoring malformed cache entry: " + it.key());
                continue;
            }
            cache.entries_[it.key()] = *entry;
        }
    }

    Logger::info("Loaded result cache with " + std::to_string(cache.entries_.size()) + " entries from " + location);
    return cache;
}

bool ResultCache::shouldSkip(const std::string &path, uint64_t size, const std::string &modified) const
{
    auto it = entries_.find(normalizeKey(path));
    if (it == entries_.end())
        return false;

    const CacheEntry &entry = it->second;
    return entry.size == size && entry.modified == modified && !entry.is_match;
}

void ResultCache::record(const std::string &path, uint64_t size, const std::string &modified,
                         int confidence, bool is_match)
{
    const std::string key = normalizeKey(path);
    entries_[key] = CacheEntry{size, modified, confidence, is_match};

    if (!is_match && std::find(scanned_files_.begin(), scanned_files_.end(), key) == scanned_files_.end())
        scanned_files_.push_back(key);

    last_updated_ = FileUtils::currentTimestamp();
}

std::optional<CacheEntry> ResultCache::getEntry(const std::string &path) const
{
    auto it = entries_.find(normalizeKey(path));
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

void ResultCache::reset()
{
    entries_.clear();
    scanned_files_.clear();
    last_updated_ = FileUtils::currentTimestamp();
    version_ = CACHE_VERSION;
    Logger::info("Result cache reset");
}

json ResultCache::toJson() const
{
    json doc;
    doc["scanned_files"] = scanned_files_;
    doc["last_updated"] = last_updated_;
    doc["cache_version"] = CACHE_VERSION;

    json metadata = json::object();
    for (const auto &[path, entry] : entries_)
    {
        metadata[path] = {
            {"size", entry.size},
            {"modified", entry.modified},
            {"confidence", entry.confidence},
            {"is_match", entry.is_match}};
    }
    doc["file_metadata"] = metadata;
    return doc;
}

OpResult ResultCache::save(const std::string &location)
{
    last_updated_ = FileUtils::currentTimestamp();

    std::error_code ec;
    fs::path target(location);
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), ec);
        if (ec)
        {
            return OpResult::failure(ScanErrorKind::PERSISTENCE_FAILURE,
                                     "Cannot create cache directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    // Written beside the target and renamed into place; the old cache survives a failed write
    const std::string temp_location = location + ".tmp";
    {
        std::ofstream out(temp_location, std::ios::trunc);
        if (!out.is_open())
        {
            return OpResult::failure(ScanErrorKind::PERSISTENCE_FAILURE, "Cannot open " + temp_location + " for writing");
        }
        // Paths are not guaranteed to be UTF-8; invalid bytes become U+FFFD instead of throwing
        out << toJson().dump(2, ' ', false, json::error_handler_t::replace);
        out.flush();
        if (!out.good())
        {
            out.close();
            fs::remove(temp_location, ec);
            return OpResult::failure(ScanErrorKind::PERSISTENCE_FAILURE, "Failed writing cache to " + temp_location);
        }
    }

    fs::rename(temp_location, location, ec);
    if (ec)
    {
        std::error_code cleanup_ec;
        fs::remove(temp_location, cleanup_ec);
        return OpResult::failure(ScanErrorKind::PERSISTENCE_FAILURE,
                                 "Cannot move cache into place at " + location + ": " + ec.message());
    }

    Logger::info("Saved result cache with " + std::to_string(entries_.size()) + " entries to " + location);
    return OpResult(true);
}
