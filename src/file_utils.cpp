#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <openssl/evp.h>
#include <sys/stat.h>

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
        return std::nullopt;

    FileMetadata metadata;
    metadata.file_path = file_path;
    metadata.file_size = static_cast<uint64_t>(st.st_size);
    metadata.modification_time = formatTimestamp(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
    metadata.modification_ns = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
    return metadata;
}

static bool isListable(const fs::path &dir, std::error_code &ec)
{
    fs::directory_iterator probe(dir, ec);
    return !ec;
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext,
                                         const std::string &excluded_dir)
{
    std::error_code ec;
    fs::path excluded;
    if (!excluded_dir.empty())
        excluded = fs::weakly_canonical(fs::path(excluded_dir), ec);

    fs::recursive_directory_iterator it(dir_path, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        Logger::warn("Cannot list " + dir_path + ": " + ec.message());
        return;
    }

    const fs::recursive_directory_iterator end;
    while (it != end)
    {
        const fs::directory_entry &entry = *it;
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec))
        {
            // Never followed, never reported
            it.disable_recursion_pending();
        }
        else if (entry.is_directory(entry_ec))
        {
            if (!excluded.empty() && fs::weakly_canonical(entry.path(), entry_ec) == excluded)
            {
                Logger::debug("Not descending into " + entry.path().string());
                it.disable_recursion_pending();
            }
            else if (!isListable(entry.path(), entry_ec))
            {
                Logger::warn("Skipping unreadable directory " + entry.path().string() + ": " + entry_ec.message());
                it.disable_recursion_pending();
            }
        }
        else if (entry.is_regular_file(entry_ec))
        {
            onNext(entry.path().string());
        }
        else if (entry_ec)
        {
            Logger::warn("Cannot inspect " + entry.path().string() + ": " + entry_ec.message());
        }

        it.increment(ec);
        if (ec)
        {
            Logger::warn("Directory walk under " + dir_path + " stopped early: " + ec.message());
            break;
        }
    }
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open())
    {
        Logger::debug("Cannot open " + file_path + " for hashing");
        return "";
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        return "";

    char chunk[64 * 1024];
    while (in)
    {
        in.read(chunk, sizeof(chunk));
        if (in.gcount() > 0 && EVP_DigestUpdate(ctx.get(), chunk, static_cast<size_t>(in.gcount())) != 1)
            return "";
    }
    if (in.bad())
        return "";

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1)
        return "";

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i)
    {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}

bool FileUtils::readFileHead(const std::string &file_path, size_t limit, std::vector<std::uint8_t> &out)
{
    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open())
        return false;

    out.resize(limit);
    in.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(limit));
    out.resize(static_cast<size_t>(in.gcount()));
    return !in.bad();
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    if (!ext.empty())
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string FileUtils::formatTimestamp(std::int64_t seconds, long nanoseconds)
{
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(9) << std::setfill('0') << nanoseconds << "+00:00";
    return out.str();
}

std::string FileUtils::currentTimestamp()
{
    using namespace std::chrono;
    const auto since_epoch = system_clock::now().time_since_epoch();
    const auto whole = duration_cast<seconds>(since_epoch);
    return formatTimestamp(whole.count(), static_cast<long>(duration_cast<nanoseconds>(since_epoch - whole).count()));
}

std::string FileUtils::humanReadableSize(uint64_t bytes)
{
    static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024)
        return std::to_string(bytes) + " B";

    double scaled = static_cast<double>(bytes);
    size_t unit = 0;
    while (scaled >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0]))
    {
        scaled /= 1024.0;
        ++unit;
    }

    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << scaled << ' ' << units[unit];
    return out.str();
}
