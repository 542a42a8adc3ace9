#include "core/scan_coordinator.hpp"
#include "core/file_utils.hpp"
#include "core/scan_errors.hpp"
#include "core/thread_pool_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

ScanCoordinator::ScanCoordinator(const EvidenceExtractor &extractor, const ScoringEngine &engine,
                                 const FileOrganizer &organizer, ScanOptions options)
    : extractor_(extractor), engine_(engine), organizer_(organizer), options_(std::move(options))
{
}

std::string ScanCoordinator::getPhaseName(ScanPhase phase)
{
    switch (phase)
    {
    case ScanPhase::IDLE:
        return "IDLE";
    case ScanPhase::ENUMERATING:
        return "ENUMERATING";
    case ScanPhase::CACHE_FILTERING:
        return "CACHE_FILTERING";
    case ScanPhase::ANALYZING:
        return "ANALYZING";
    case ScanPhase::ORGANIZING:
        return "ORGANIZING";
    case ScanPhase::PERSISTING:
        return "PERSISTING";
    case ScanPhase::DONE:
        return "DONE";
    default:
        return "UNKNOWN";
    }
}

void ScanCoordinator::enterPhase(ScanPhase phase)
{
    phase_ = phase;
    Logger::debug("Scan phase: " + getPhaseName(phase));
}

std::string ScanCoordinator::validateRoot(const std::string &root)
{
    if (!FileUtils::isValidDirectory(root))
    {
        throw std::invalid_argument("Scan root is not an accessible directory: " + root);
    }

    std::error_code ec;
    fs::path canonical = fs::canonical(root, ec);
    if (ec)
    {
        throw std::invalid_argument("Cannot resolve scan root " + root + ": " + ec.message());
    }

    // Unlistable roots are fatal too
    fs::directory_iterator probe(canonical, ec);
    if (ec)
    {
        throw std::invalid_argument("Scan root is not readable: " + root + " (" + ec.message() + ")");
    }
    return canonical.string();
}

bool ScanCoordinator::isRecognized(const std::string &path) const
{
    const std::string ext = FileUtils::getFileExtension(path);
    return options_.photo_extensions.count(ext) > 0 || options_.video_extensions.count(ext) > 0;
}

MediaKind ScanCoordinator::mediaKindFor(const std::string &path) const
{
    return options_.video_extensions.count(FileUtils::getFileExtension(path)) > 0 ? MediaKind::VIDEO
                                                                                  : MediaKind::PHOTO;
}

std::vector<std::string> ScanCoordinator::enumerate(const std::string &root, const std::string &excluded_dir) const
{
    std::vector<std::string> files;
    FileUtils::scanDirectoryRecursively(
        root,
        [this, &files](const std::string &path)
        {
            if (isRecognized(path))
                files.push_back(path);
        },
        excluded_dir);

    std::sort(files.begin(), files.end());
    return files;
}

std::vector<FileVerdict> ScanCoordinator::analyze(const std::vector<std::string> &paths) const
{
    std::vector<FileVerdict> results(paths.size());

    ThreadPoolManager::processFiles(
        paths,
        [this, &results](size_t index, const std::string &path)
        {
            FileVerdict &slot = results[index];
            slot.path = path;
            slot.kind = mediaKindFor(path);
            try
            {
                EvidenceBundle bundle = extractor_.extract(path);
                slot.score = engine_.score(bundle, slot.kind);
                slot.analyzed = true;
            }
            catch (const IoError &e)
            {
                slot.error_message = e.what();
            }
            catch (const std::exception &e)
            {
                slot.error_message = "Unexpected error analyzing " + path + ": " + e.what();
            }
        });

    return results;
}

ScanSummary ScanCoordinator::scan(const std::string &root, bool apply)
{
    const auto started = std::chrono::steady_clock::now();
    const std::string scan_root = validateRoot(root);

    ScanSummary summary;
    summary.apply_mode = apply;

    OrganizationLayout layout = organizer_.resolveLayout(scan_root);
    summary.organization_root = layout.root;
    summary.cache_path = layout.cache_path;
    summary.used_fallback_location = layout.used_fallback;
    summary.fallback_notice = layout.notice;

    Logger::info("Scanning " + scan_root + (apply ? " (apply mode: files will be moved)" : " (preview mode: files will be copied)"));

    enterPhase(ScanPhase::ENUMERATING);
    const std::string excluded = (fs::path(scan_root) / organizer_.options().folder_name).string();
    std::vector<std::string> files = enumerate(scan_root, excluded);
    summary.total_files = files.size();
    Logger::info("Found " + std::to_string(files.size()) + " media files");

    enterPhase(ScanPhase::CACHE_FILTERING);
    ResultCache cache = ResultCache::load(layout.cache_path);
    std::vector<Candidate> candidates;
    candidates.reserve(files.size());
    for (const auto &path : files)
    {
        auto metadata = FileUtils::getFileMetadata(path);
        if (!metadata)
        {
            Logger::warn("Skipping unreadable file: " + path);
            summary.failed_files++;
            FileVerdict failed;
            failed.path = path;
            failed.kind = mediaKindFor(path);
            failed.error_message = "cannot read file attributes";
            summary.results.push_back(failed);
            continue;
        }
        if (cache.shouldSkip(path, metadata->file_size, metadata->modification_time))
        {
            summary.skipped_cached++;
            continue;
        }
        candidates.push_back(Candidate{path, metadata->file_size, metadata->modification_time});
    }
    Logger::info(std::to_string(summary.skipped_cached) + " files unchanged since last scan, " +
                 std::to_string(candidates.size()) + " to analyze");

    enterPhase(ScanPhase::ANALYZING);
    std::vector<std::string> paths;
    paths.reserve(candidates.size());
    for (const auto &candidate : candidates)
        paths.push_back(candidate.path);
    std::vector<FileVerdict> analyzed = analyze(paths);

    enterPhase(ScanPhase::ORGANIZING);
    for (size_t i = 0; i < candidates.size(); ++i)
    {
        const Candidate &candidate = candidates[i];
        FileVerdict &verdict = analyzed[i];

        if (!verdict.analyzed)
        {
            Logger::warn("Skipping " + candidate.path + ": " + verdict.error_message);
            summary.failed_files++;
            summary.results.push_back(verdict);
            continue;
        }

        const ScoreResult &score = verdict.score;
        switch (score.verdict)
        {
        case Verdict::CONFIRMED:
            summary.confirmed++;
            break;
        case Verdict::LIKELY:
            summary.likely++;
            break;
        case Verdict::POSSIBLE:
            summary.possible++;
            break;
        case Verdict::UNLIKELY:
            summary.unlikely++;
            break;
        }

        if (score.confidence >= Verdicts::POSSIBLE_THRESHOLD)
        {
            Logger::info(Verdicts::getName(score.verdict) + " (" + std::to_string(score.confidence) + "): " + candidate.path);
            OrganizeResult organized = organizer_.organize(layout, candidate.path, score.verdict, score.confidence, apply);
            verdict.action = organized.action;
            verdict.destination = organized.destination;
            if (!organized.success)
            {
                summary.organize_failures++;
                verdict.error_message = organized.error_message;
            }
            else if (apply && (organized.action == OrganizeAction::MOVED || organized.action == OrganizeAction::COPIED))
            {
                summary.moved_files.push_back(organized.destination);
            }
        }
        else
        {
            cache.record(candidate.path, candidate.size, candidate.modified, score.confidence, false);
        }

        summary.results.push_back(verdict);
    }

    enterPhase(ScanPhase::PERSISTING);
    OpResult saved = cache.save(layout.cache_path);
    summary.cache_persisted = saved.success;
    if (!saved.success)
    {
        Logger::warn("Result cache not saved (" + ScanErrors::getKindName(saved.error_kind) + "): " + saved.error_message);
    }

    enterPhase(ScanPhase::DONE);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    Logger::info("Scan finished in " + std::to_string(elapsed.count()) + " ms: " +
                 std::to_string(summary.confirmed) + " confirmed, " +
                 std::to_string(summary.likely) + " likely, " +
                 std::to_string(summary.possible) + " possible, " +
                 std::to_string(summary.unlikely) + " unlikely, " +
                 std::to_string(summary.skipped_cached) + " cached, " +
                 std::to_string(summary.failed_files) + " failed");
    return summary;
}

std::vector<FileVerdict> ScanCoordinator::analyzeDirectory(const std::string &root)
{
    const std::string scan_root = validateRoot(root);

    enterPhase(ScanPhase::ENUMERATING);
    const std::string excluded = (fs::path(scan_root) / organizer_.options().folder_name).string();
    std::vector<std::string> files = enumerate(scan_root, excluded);

    enterPhase(ScanPhase::ANALYZING);
    std::vector<FileVerdict> results = analyze(files);
    for (const auto &result : results)
    {
        if (!result.analyzed)
            Logger::warn("Skipping " + result.path + ": " + result.error_message);
    }

    enterPhase(ScanPhase::DONE);
    return results;
}
