#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Attributes used for cache change detection
 */
struct FileMetadata
{
    std::string file_path;
    uint64_t file_size = 0;
    std::string modification_time;    // RFC 3339, UTC, nanosecond fraction
    std::int64_t modification_ns = 0; // nanoseconds since the epoch
};

/**
 * @brief Filesystem helpers shared by the scanner, extractor and organizer
 */
class FileUtils
{
public:
    /**
     * @brief Stat a regular file without reading it
     * @return nullopt for missing, unreadable or non-regular paths
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * @brief Report every regular file below dir_path
     *
     * Symlinks are not followed. Unreadable subdirectories are logged and
     * skipped, and excluded_dir (when set) is not entered.
     * @param onNext Called once per file, in directory order
     */
    static void scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext,
                                         const std::string &excluded_dir = "");

    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Lowercase hex SHA-256 of the file content, empty on failure
     */
    static std::string computeFileHash(const std::string &file_path);

    /**
     * @brief Read at most limit bytes from the start of a file
     * @return false if the file could not be opened
     */
    static bool readFileHead(const std::string &file_path, size_t limit, std::vector<std::uint8_t> &out);

    // Lowercase, without the dot; "" when there is none
    static std::string getFileExtension(const std::string &file_path);

    /**
     * @brief e.g. 1970-01-01T00:00:00.000000005+00:00
     */
    static std::string formatTimestamp(std::int64_t seconds, long nanoseconds);
    static std::string currentTimestamp();

    static std::string humanReadableSize(uint64_t bytes);
};
