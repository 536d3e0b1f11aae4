#include "sztune/tuner/workspace.h"
#include "sztune/core/logger.h"
#include "sztune/tuner/tuner-errors.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace sztune::tuner {

namespace {

bool
is_archive(const fs::directory_entry& entry)
{
    return fs::is_regular_file(entry.status()) &&
        entry.path().extension() == ARCHIVE_EXTENSION;
}

}  // namespace

std::vector<std::string>
list_directories(const fs::path& root)
{
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(root))
    {
        if (!fs::is_directory(entry.status()))
        {
            continue;
        }

        auto name = entry.path().filename().string();
        if (name.empty() || name.front() == '.' || name == VENV_DIRECTORY)
        {
            continue;
        }
        names.push_back(std::move(name));
    }

    std::sort(names.begin(), names.end());
    return names;
}

uint64_t
total_archive_size(const fs::path& dir)
{
    uint64_t total = 0;
    for (const auto& entry : fs::directory_iterator(dir))
    {
        if (is_archive(entry))
        {
            total += fs::file_size(entry.path());
        }
    }
    return total;
}

size_t
remove_archives(const fs::path& dir)
{
    // Collect first, removing while iterating is unspecified
    std::vector<fs::path> archives;
    for (const auto& entry : fs::directory_iterator(dir))
    {
        if (is_archive(entry))
        {
            archives.push_back(entry.path());
        }
    }

    for (const auto& archive : archives)
    {
        LOGD("Removing archive ", archive.string());
        fs::remove(archive);
    }
    return archives.size();
}

ArchiveScope::ArchiveScope(const fs::path& root)
    : path_(root / fs::unique_path(".sztune-scratch-%%%%-%%%%-%%%%"))
{
    try
    {
        fs::create_directory(path_);
    }
    catch (const fs::filesystem_error& e)
    {
        throw TunerError("Failed to create scratch directory", e);
    }
    LOGD("Acquired scratch directory ", path_.string());
}

ArchiveScope::~ArchiveScope()
{
    boost::system::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
    {
        LOGW(
            "Failed to remove scratch directory ",
            path_.string(),
            ": ",
            ec.message());
    }
}

std::string
format_file_size(uint64_t bytes)
{
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    auto size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4)
    {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " "
        << units[unit_index];
    return oss.str();
}

}  // namespace sztune::tuner
