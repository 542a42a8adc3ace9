#include "core/file_organizer.hpp"
#include "core/file_utils.hpp"
#include "core/mount_manager.hpp"
#include "logging/logger.hpp"
#include <fstream>

FileOrganizer::FileOrganizer(OrganizerOptions options)
    : options_(std::move(options))
{
}

fs::path FileOrganizer::scratchDir() const
{
    if (!options_.scratch_dir.empty())
        return fs::path(options_.scratch_dir);

    std::error_code ec;
    fs::path temp = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : temp;
}

OpResult FileOrganizer::createTierFolders(const fs::path &root)
{
    static const Verdict tiers[] = {Verdict::CONFIRMED, Verdict::LIKELY, Verdict::POSSIBLE, Verdict::UNLIKELY};

    for (Verdict tier : tiers)
    {
        std::error_code ec;
        fs::path dir = root / Verdicts::getTierFolder(tier);
        fs::create_directories(dir, ec);
        if (ec || !fs::is_directory(dir))
        {
            return OpResult::failure(ScanErrorKind::PERSISTENCE_FAILURE,
                                     "Cannot create " + dir.string() + (ec ? ": " + ec.message() : ""));
        }
    }
    return OpResult(true);
}

OrganizationLayout FileOrganizer::resolveLayout(const std::string &scan_root) const
{
    OrganizationLayout layout;
    const fs::path device_root = fs::path(scan_root) / options_.folder_name;
    layout.constrained_mount = MountManager::getInstance().isConstrainedPath(scan_root);

    OpResult created = createTierFolders(device_root);
    if (created.success)
    {
        layout.root = device_root.string();
        if (layout.constrained_mount)
        {
            // Device storage keeps the tier folders, the cache stays local
            layout.cache_path = (scratchDir() / options_.phone_cache_file_name).string();
            Logger::info("Constrained mount detected, organizing on device at " + layout.root +
                         " with cache at " + layout.cache_path);
        }
        else
        {
            layout.cache_path = (device_root / options_.cache_file_name).string();
        }
        return layout;
    }

    Logger::warn("Cannot create organization folders under " + scan_root + ": " + created.error_message);

    const fs::path fallback_root = scratchDir() / options_.folder_name;
    OpResult fallback_created = createTierFolders(fallback_root);
    if (!fallback_created.success)
    {
        Logger::error("Fallback organization folders unavailable: " + fallback_created.error_message);
    }

    layout.root = fallback_root.string();
    layout.cache_path = (fallback_root / options_.cache_file_name).string();
    layout.used_fallback = true;
    layout.notice = "Could not create folders in " + scan_root + "; organized results are in " + layout.root +
                    ". Copy them back to the device manually if needed.";
    Logger::warn(layout.notice);
    return layout;
}

fs::path FileOrganizer::resolveConflict(const fs::path &target_dir, const std::string &filename) const
{
    std::error_code ec;
    fs::path candidate = target_dir / filename;
    if (!fs::exists(candidate, ec))
        return candidate;

    const fs::path name(filename);
    const std::string stem = name.stem().string();
    const std::string ext = name.extension().string();

    for (int i = 1; i <= options_.max_conflict_attempts; ++i)
    {
        candidate = target_dir / (stem + "_" + std::to_string(i) + ext);
        if (!fs::exists(candidate, ec))
            return candidate;
    }

    throw ConflictUnresolved((target_dir / filename).string(), options_.max_conflict_attempts);
}

OrganizeResult FileOrganizer::organize(const OrganizationLayout &layout, const std::string &source,
                                       Verdict verdict, int confidence, bool apply) const
{
    const fs::path tier_dir = fs::path(layout.root) / Verdicts::getTierFolder(verdict);
    const std::string filename = fs::path(source).filename().string();

    std::error_code ec;
    fs::create_directories(tier_dir, ec);
    if (ec)
        Logger::debug("Tier folder " + tier_dir.string() + " unavailable: " + ec.message());

    fs::path target;
    try
    {
        target = resolveConflict(tier_dir, filename);
    }
    catch (const ConflictUnresolved &e)
    {
        Logger::error(e.what());
        return OrganizeResult(false, OrganizeAction::NONE, "", ScanErrorKind::CONFLICT_UNRESOLVED, e.what());
    }

    if (apply)
    {
        fs::rename(source, target, ec);
        if (!ec)
        {
            Logger::info("Moved " + source + " -> " + target.string());
            return OrganizeResult(true, OrganizeAction::MOVED, target.string());
        }
        Logger::warn("Move failed for " + source + " (" + ec.message() + "), trying copy");

        fs::copy_file(source, target, fs::copy_options::none, ec);
        if (!ec)
        {
            Logger::info("Copied " + source + " -> " + target.string() + " (original left in place)");
            return OrganizeResult(true, OrganizeAction::COPIED, target.string());
        }
        Logger::warn("Copy failed for " + source + " (" + ec.message() + "), recording detection instead");
        return writeScratchRecord(source, verdict, confidence, target.string());
    }

    fs::copy_file(source, target, fs::copy_options::none, ec);
    if (!ec)
    {
        Logger::info("Preview copy " + source + " -> " + target.string());
        return OrganizeResult(true, OrganizeAction::COPIED, target.string());
    }
    Logger::warn("Preview copy failed for " + source + " (" + ec.message() + ")");

    fs::path info_path = target;
    info_path.replace_extension(".detection_info.txt");
    if (writeRecord(info_path, source, verdict, confidence, target.string()))
    {
        Logger::info("Recorded detection for " + source + " at " + info_path.string());
        return OrganizeResult(true, OrganizeAction::SIDECAR_RECORDED, info_path.string());
    }
    return writeScratchRecord(source, verdict, confidence, target.string());
}

OrganizeResult FileOrganizer::writeScratchRecord(const std::string &source, Verdict verdict, int confidence,
                                                 const std::string &intended) const
{
    const std::string tier = Verdicts::getTierFolder(verdict);
    const fs::path record_dir = scratchDir() / "tiktok_detection_results" / tier;
    const fs::path record_path = record_dir / (fs::path(source).stem().string() + "_" + tier + ".txt");

    std::error_code ec;
    fs::create_directories(record_dir, ec);
    if (!ec && writeRecord(record_path, source, verdict, confidence, intended))
    {
        Logger::info("Recorded detection for " + source + " at " + record_path.string());
        return OrganizeResult(true, OrganizeAction::SIDECAR_RECORDED, record_path.string());
    }

    const std::string message = "Could not organize or record " + source + " (confidence " +
                                std::to_string(confidence) + ", " + Verdicts::getName(verdict) + ")";
    Logger::warn(message);
    return OrganizeResult(false, OrganizeAction::NONE, "", ScanErrorKind::PERSISTENCE_FAILURE, message);
}

bool FileOrganizer::writeRecord(const fs::path &record_path, const std::string &source, Verdict verdict,
                                int confidence, const std::string &intended)
{
    std::ofstream out(record_path, std::ios::trunc);
    if (!out.is_open())
        return false;

    out << "TikTok detection record\n"
        << "Original file: " << source << "\n"
        << "Confidence: " << confidence << "\n"
        << "Category: " << Verdicts::getTierFolder(verdict) << " (" << Verdicts::getDescription(verdict) << ")\n"
        << "Detected at: " << FileUtils::currentTimestamp() << "\n"
        << "Intended destination: " << intended << "\n";
    out.flush();
    return out.good();
}

std::string FileOrganizer::getActionName(OrganizeAction action)
{
    switch (action)
    {
    case OrganizeAction::NONE:
        return "NONE";
    case OrganizeAction::MOVED:
        return "MOVED";
    case OrganizeAction::COPIED:
        return "COPIED";
    case OrganizeAction::SIDECAR_RECORDED:
        return "SIDECAR_RECORDED";
    default:
        return "UNKNOWN";
    }
}
