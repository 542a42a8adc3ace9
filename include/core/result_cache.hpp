#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/scan_errors.hpp"

struct CacheEntry
{
    uint64_t size = 0;
    std::string modified; // RFC 3339 string compared verbatim
    int confidence = 0;
    bool is_match = false;
};

/**
 * @brief Persistent record of files already classified as non-matches
 *
 * Owned by one scan at a time: loaded once, mutated in memory by the
 * coordinating thread, saved once. Not thread-safe.
 */
class ResultCache
{
public:
    static constexpr const char *CACHE_VERSION = "2.0";

    ResultCache();

    /**
     * @brief Load a cache document; never fails
     *
     * A missing file yields an empty cache. A corrupt file yields an empty
     * cache and a warning. A legacy document (plain path list) is migrated.
     * @param location Path of the JSON document
     */
    static ResultCache load(const std::string &location);

    /**
     * @brief Whether a file can be skipped without re-analysis
     *
     * True only if an entry exists, size and modification stamp are equal,
     * and the entry was not a match.
     */
    bool shouldSkip(const std::string &path, uint64_t size, const std::string &modified) const;

    /**
     * @brief Insert or overwrite the entry for a file
     */
    void record(const std::string &path, uint64_t size, const std::string &modified,
                int confidence, bool is_match);

    /**
     * @brief Write the cache document, creating its directory when needed
     * @return PERSISTENCE_FAILURE on any write error; never throws
     */
    OpResult save(const std::string &location);

    void reset();

    size_t size() const { return entries_.size(); }
    std::optional<CacheEntry> getEntry(const std::string &path) const;
    const std::string &lastUpdated() const { return last_updated_; }
    const std::string &version() const { return version_; }
    const std::vector<std::string> &scannedFiles() const { return scanned_files_; }

    /**
     * @brief True when the last load discarded an unreadable document
     */
    bool recoveredFromCorruption() const { return recovered_from_corruption_; }

    nlohmann::json toJson() const;

private:
    static std::string normalizeKey(const std::string &path);
    static ResultCache fromJson(const nlohmann::json &doc, const std::string &location);

    std::map<std::string, CacheEntry> entries_;
    std::vector<std::string> scanned_files_;
    std::string last_updated_;
    std::string version_;
    bool recovered_from_corruption_ = false;
};
