#include "core/mount_manager.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>

MountManager &MountManager::getInstance()
{
    static MountManager instance;
    return instance;
}

MountManager::MountManager()
    : constrained_patterns_({"gvfs/mtp", "run/user"}), mounts_file_("/proc/mounts")
{
}

std::string MountManager::decodeMountField(const std::string &field)
{
    // The mount table escapes space, tab, newline and backslash as \ooo
    std::string decoded;
    for (size_t i = 0; i < field.size(); ++i)
    {
        if (field[i] == '\\' && i + 3 < field.size())
        {
            const std::string octal = field.substr(i + 1, 3);
            if (std::all_of(octal.begin(), octal.end(), [](char c)
                                                 { return c >= '0' && c <= '7'; }))
            {
                decoded.push_back(static_cast<char>(std::stoi(octal, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        decoded.push_back(field[i]);
    }
    return decoded;
}

bool MountManager::isConstrainedFilesystemType(const std::string &mount_type)
{
    static const std::vector<std::string> constrained_types = {
        "fuse.gvfsd-fuse", "fuse.jmtpfs", "fuse.simple-mtpfs", "fuse.go-mtpfs", "fuse.aft-mtp-mount"};
    return std::find(constrained_types.begin(), constrained_types.end(), mount_type) != constrained_types.end();
}

std::vector<MountInfo> MountManager::detectMounts()
{
    std::vector<MountInfo> mounts;

    std::string mounts_file;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mounts_file = mounts_file_;
    }

    std::ifstream table(mounts_file);
    if (!table.is_open())
    {
        Logger::debug("Mount table not readable: " + mounts_file);
        return mounts;
    }

    // Each line: device mount_point type options dump pass
    std::string line;
    while (std::getline(table, line))
    {
        std::vector<std::string> fields;
        std::istringstream columns(line);
        for (std::string field; columns >> field && fields.size() < 4;)
            fields.push_back(field);
        if (fields.size() < 4)
            continue;

        MountInfo mount;
        mount.device = decodeMountField(fields[0]);
        mount.mount_point = decodeMountField(fields[1]);
        mount.mount_type = fields[2];
        mount.is_constrained = isConstrainedFilesystemType(mount.mount_type);
        mounts.push_back(std::move(mount));
    }

    return mounts;
}

void MountManager::refreshMounts()
{
    auto mounts = detectMounts();
    std::lock_guard<std::mutex> lock(mutex_);
    cached_mounts_ = std::move(mounts);
    mounts_loaded_ = true;
    Logger::debug("Mount table refreshed: " + std::to_string(cached_mounts_.size()) + " entries");
}

std::optional<MountInfo> MountManager::getMountInfo(const std::string &path)
{
    bool loaded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loaded = mounts_loaded_;
    }
    if (!loaded)
        refreshMounts();

    std::error_code ec;
    std::string absolute = fs::absolute(fs::path(path), ec).lexically_normal().string();
    if (ec)
        absolute = path;

    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<MountInfo> best;
    for (const auto &mount : cached_mounts_)
    {
        const std::string &mp = mount.mount_point;
        bool prefixes = absolute == mp ||
                        (absolute.compare(0, mp.size(), mp) == 0 &&
                         (mp == "/" || (absolute.size() > mp.size() && absolute[mp.size()] == '/')));
        if (prefixes && (!best || mp.size() > best->mount_point.size()))
            best = mount;
    }
    return best;
}

bool MountManager::isConstrainedPath(const std::string &path)
{
    for (const auto &pattern : getConstrainedPatterns())
    {
        if (!pattern.empty() && path.find(pattern) != std::string::npos)
        {
            Logger::debug("Path " + path + " matches constrained pattern '" + pattern + "'");
            return true;
        }
    }

    auto mount = getMountInfo(path);
    if (mount && mount->is_constrained)
    {
        Logger::debug("Path " + path + " is on " + mount->mount_type + " mount " + mount->mount_point);
        return true;
    }
    return false;
}

void MountManager::setConstrainedPatterns(const std::vector<std::string> &patterns)
{
    std::lock_guard<std::mutex> lock(mutex_);
    constrained_patterns_ = patterns;
}

std::vector<std::string> MountManager::getConstrainedPatterns() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return constrained_patterns_;
}

void MountManager::setMountsFile(const std::string &mounts_file)
{
    std::lock_guard<std::mutex> lock(mutex_);
    mounts_file_ = mounts_file;
    cached_mounts_.clear();
    mounts_loaded_ = false;
}
