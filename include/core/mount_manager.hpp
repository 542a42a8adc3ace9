#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

struct MountInfo
{
    std::string device;      // e.g. "gvfsd-fuse"
    std::string mount_point; // e.g. "/run/user/1000/gvfs"
    std::string mount_type;  // e.g. "fuse.gvfsd-fuse"
    bool is_constrained;     // phone storage exposed through MTP/gvfs
};

/**
 * @brief Detects whether a path lives on a constrained (phone/MTP) mount
 *
 * Phone storage mounted through gvfs or an MTP FUSE driver often refuses
 * renames and directory creation, so organization targets are chosen
 * differently there.
 */
class MountManager
{
public:
    static MountManager &getInstance();

    /**
     * @brief Read the mount table
     * @return Vector of mount information, empty if the table is unreadable
     */
    std::vector<MountInfo> detectMounts();

    /**
     * @brief Check if a path is on a constrained mount
     *
     * Matches either a configured path substring or a mount table entry
     * with an MTP/gvfs filesystem type whose mount point contains the path.
     * @param path The path to check
     * @return true if on a constrained mount
     */
    bool isConstrainedPath(const std::string &path);

    /**
     * @brief Get the mount with the longest mount point that prefixes the path
     * @param path The path to check
     * @return Optional mount info, or nullopt if no mount matches
     */
    std::optional<MountInfo> getMountInfo(const std::string &path);

    /**
     * @brief Replace the path substrings that mark constrained locations
     */
    void setConstrainedPatterns(const std::vector<std::string> &patterns);

    std::vector<std::string> getConstrainedPatterns() const;

    /**
     * @brief Use another mount table file (default /proc/mounts)
     */
    void setMountsFile(const std::string &mounts_file);

    /**
     * @brief Refresh mount cache
     */
    void refreshMounts();

    static bool isConstrainedFilesystemType(const std::string &mount_type);

private:
    MountManager();
    ~MountManager() = default;
    MountManager(const MountManager &) = delete;
    MountManager &operator=(const MountManager &) = delete;

    static std::string decodeMountField(const std::string &field);

    mutable std::mutex mutex_;
    std::vector<MountInfo> cached_mounts_;
    bool mounts_loaded_ = false;
    std::vector<std::string> constrained_patterns_;
    std::string mounts_file_;
};
