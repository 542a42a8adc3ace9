#pragma once

#include <stdexcept>
#include <string>

enum class ScanErrorKind
{
    NONE,
    IO_ERROR,            // file unreadable or attributes unavailable
    CACHE_CORRUPT,       // cache document could not be parsed
    CONFLICT_UNRESOLVED, // every candidate destination name was taken
    PERSISTENCE_FAILURE  // cache or organization write failed
};

/**
 * @brief Thrown by the evidence extractor when a file cannot be opened or stat'ed
 */
class IoError : public std::runtime_error
{
public:
    IoError(const std::string &path, const std::string &reason)
        : std::runtime_error("I/O error on " + path + ": " + reason), path_(path) {}

    const std::string &path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Thrown when no free destination name exists within the probe bound
 */
class ConflictUnresolved : public std::runtime_error
{
public:
    ConflictUnresolved(const std::string &target, int attempts)
        : std::runtime_error("Could not find a free name for " + target + " after " +
                             std::to_string(attempts) + " attempts"),
          target_(target) {}

    const std::string &target() const { return target_; }

private:
    std::string target_;
};

// Result of a best-effort operation (cache save, folder creation, organize)
struct OpResult
{
    bool success;
    ScanErrorKind error_kind;
    std::string error_message;

    OpResult(bool s = true, ScanErrorKind kind = ScanErrorKind::NONE, const std::string &msg = "")
        : success(s), error_kind(kind), error_message(msg) {}

    static OpResult failure(ScanErrorKind kind, const std::string &msg)
    {
        return OpResult(false, kind, msg);
    }
};

class ScanErrors
{
public:
    static std::string getKindName(ScanErrorKind kind)
    {
        switch (kind)
        {
        case ScanErrorKind::NONE:
            return "NONE";
        case ScanErrorKind::IO_ERROR:
            return "IO_ERROR";
        case ScanErrorKind::CACHE_CORRUPT:
            return "CACHE_CORRUPT";
        case ScanErrorKind::CONFLICT_UNRESOLVED:
            return "CONFLICT_UNRESOLVED";
        case ScanErrorKind::PERSISTENCE_FAILURE:
            return "PERSISTENCE_FAILURE";
        default:
            return "UNKNOWN";
        }
    }
};
