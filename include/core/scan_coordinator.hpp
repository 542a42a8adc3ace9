#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include "core/evidence.hpp"
#include "core/evidence_extractor.hpp"
#include "core/file_organizer.hpp"
#include "core/result_cache.hpp"
#include "core/scoring_engine.hpp"

enum class ScanPhase
{
    IDLE,
    ENUMERATING,
    CACHE_FILTERING,
    ANALYZING,
    ORGANIZING,
    PERSISTING,
    DONE
};

struct ScanOptions
{
    std::set<std::string> photo_extensions = {"jpg", "jpeg", "png", "webp", "gif", "bmp"};
    std::set<std::string> video_extensions = {"mp4", "mov", "avi", "mkv", "flv", "webm"};
};

/**
 * @brief Outcome for one analyzed file
 */
struct FileVerdict
{
    std::string path;
    MediaKind kind = MediaKind::PHOTO;
    bool analyzed = false; // false when extraction failed
    std::string error_message;
    ScoreResult score;
    OrganizeAction action = OrganizeAction::NONE;
    std::string destination;
};

struct ScanSummary
{
    size_t total_files = 0;
    size_t confirmed = 0;
    size_t likely = 0;
    size_t possible = 0;
    size_t unlikely = 0;
    size_t skipped_cached = 0;
    size_t failed_files = 0;       // unreadable during stat or extraction
    size_t organize_failures = 0;  // conflicts and unrecordable detections
    std::vector<std::string> moved_files;
    std::vector<FileVerdict> results; // unreadable files first, then analyzed files in enumeration order
    bool apply_mode = false;

    std::string organization_root;
    std::string cache_path;
    bool used_fallback_location = false;
    std::string fallback_notice;
    bool cache_persisted = false;
};

/**
 * @brief Runs a scan: Enumerating -> CacheFiltering -> Analyzing -> Organizing -> Persisting
 *
 * Only the analyzing phase is parallel. The cache and every filesystem write
 * stay on the calling thread, and organization happens in enumeration order.
 */
class ScanCoordinator
{
public:
    ScanCoordinator(const EvidenceExtractor &extractor, const ScoringEngine &engine,
                    const FileOrganizer &organizer, ScanOptions options = ScanOptions());

    /**
     * @brief Scan a directory tree and organize what is found
     * @param root Directory to scan
     * @param apply Move files when true, copy them when false
     * @return Aggregate counters and per-file results
     * @throws std::invalid_argument if root is not an accessible directory
     */
    ScanSummary scan(const std::string &root, bool apply);

    /**
     * @brief Classify every recognized file under root without side effects
     *
     * No cache, no organization. Used by the benchmark.
     * @throws std::invalid_argument if root is not an accessible directory
     */
    std::vector<FileVerdict> analyzeDirectory(const std::string &root);

    /**
     * @brief Recognized media files under root, sorted by path
     */
    std::vector<std::string> enumerate(const std::string &root, const std::string &excluded_dir) const;

    bool isRecognized(const std::string &path) const;
    MediaKind mediaKindFor(const std::string &path) const;

    ScanPhase currentPhase() const { return phase_; }
    static std::string getPhaseName(ScanPhase phase);

private:
    struct Candidate
    {
        std::string path;
        uint64_t size;
        std::string modified;
    };

    static std::string validateRoot(const std::string &root);
    std::vector<FileVerdict> analyze(const std::vector<std::string> &paths) const;
    void enterPhase(ScanPhase phase);

    const EvidenceExtractor &extractor_;
    const ScoringEngine &engine_;
    const FileOrganizer &organizer_;
    ScanOptions options_;
    ScanPhase phase_ = ScanPhase::IDLE;
};
