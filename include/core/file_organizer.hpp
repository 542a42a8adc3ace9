#pragma once

#include <filesystem>
#include <string>
#include "core/scan_errors.hpp"
#include "core/verdict.hpp"

namespace fs = std::filesystem;

struct OrganizerOptions
{
    std::string folder_name = "tiktok_detection";
    std::string cache_file_name = "not_tiktok.json";
    std::string phone_cache_file_name = "tiktok_phone_cache.json";
    std::string scratch_dir; // empty means the system temp directory
    int max_conflict_attempts = 999;
};

/**
 * @brief Where organized files and the result cache go for one scan
 */
struct OrganizationLayout
{
    std::string root;       // folder holding the tier subfolders
    std::string cache_path; // result cache document
    bool constrained_mount = false;
    bool used_fallback = false; // root is in the scratch directory
    std::string notice;         // user-facing explanation when used_fallback is set
};

enum class OrganizeAction
{
    NONE,
    MOVED,
    COPIED,
    SIDECAR_RECORDED
};

struct OrganizeResult
{
    bool success;
    OrganizeAction action;
    std::string destination; // final file, or sidecar record path
    ScanErrorKind error_kind;
    std::string error_message;

    OrganizeResult(bool s = false, OrganizeAction a = OrganizeAction::NONE, const std::string &dest = "",
                   ScanErrorKind kind = ScanErrorKind::NONE, const std::string &msg = "")
        : success(s), action(a), destination(dest), error_kind(kind), error_message(msg) {}
};

/**
 * @brief Places classified files into confidence-tier folders
 *
 * Every write is best effort: a failed move falls back to a copy, a failed
 * copy falls back to a text record of the detection. Only the scan
 * coordinator's sequential organizing phase calls into this class.
 */
class FileOrganizer
{
public:
    explicit FileOrganizer(OrganizerOptions options = OrganizerOptions());

    /**
     * @brief Decide and create the organization folders for a scan root
     *
     * On a constrained mount the folders are attempted on the device while
     * the cache is kept in the scratch directory. When folders cannot be
     * created under the root, the scratch directory is used for both and
     * the layout is flagged as a fallback.
     * @param scan_root Root directory of the scan
     * @return Layout used by organize() and by the cache
     */
    OrganizationLayout resolveLayout(const std::string &scan_root) const;

    /**
     * @brief Organize one classified file
     * @param layout Layout from resolveLayout()
     * @param source File to organize
     * @param verdict Tier to place it in
     * @param confidence Score, written to sidecar records
     * @param apply Move when true, copy when false
     */
    OrganizeResult organize(const OrganizationLayout &layout, const std::string &source,
                            Verdict verdict, int confidence, bool apply) const;

    /**
     * @brief First free name for filename in target_dir
     *
     * Returns target_dir/filename when free, otherwise stem_N.ext for the
     * smallest free N.
     * @throws ConflictUnresolved when every suffix up to the limit is taken
     */
    fs::path resolveConflict(const fs::path &target_dir, const std::string &filename) const;

    /**
     * @brief Create root plus the four tier folders
     */
    static OpResult createTierFolders(const fs::path &root);

    fs::path scratchDir() const;

    const OrganizerOptions &options() const { return options_; }

    static std::string getActionName(OrganizeAction action);

private:
    OrganizeResult writeScratchRecord(const std::string &source, Verdict verdict, int confidence,
                                      const std::string &intended) const;
    static bool writeRecord(const fs::path &record_path, const std::string &source, Verdict verdict,
                            int confidence, const std::string &intended);

    OrganizerOptions options_;
};
