#pragma once

#include <boost/filesystem.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace sztune::tuner {

namespace fs = boost::filesystem;

/** Archive extension written by the compressor */
inline constexpr const char* ARCHIVE_EXTENSION = ".7z";

/** Directory name never treated as compressor input */
inline constexpr const char* VENV_DIRECTORY = "venv";

/**
 * List the directories to compress directly under `root`
 *
 * Hidden entries (leading '.') and the virtual environment directory are
 * skipped. The result is sorted by name and enumerated fresh on every call.
 *
 * @param root The working root
 * @return Directory names relative to `root`
 */
std::vector<std::string>
list_directories(const fs::path& root);

/**
 * Sum the sizes of all `*.7z` regular files directly inside `dir`
 */
uint64_t
total_archive_size(const fs::path& dir);

/**
 * Delete all `*.7z` regular files directly inside `dir`
 *
 * @return Number of archives removed
 */
size_t
remove_archives(const fs::path& dir);

/**
 * Scoped scratch storage for one measured compressor run.
 *
 * Creates a hidden, uniquely named directory under the working root and
 * removes it, with everything written into it, when the scope ends. Hidden
 * names are never listed as input directories.
 */
class ArchiveScope
{
public:
    explicit ArchiveScope(const fs::path& root);
    ~ArchiveScope();

    ArchiveScope(const ArchiveScope&) = delete;
    ArchiveScope&
    operator=(const ArchiveScope&) = delete;

    const fs::path&
    path() const
    {
        return path_;
    }

    /** Total size of the archives written into this scope so far */
    uint64_t
    archive_size() const
    {
        return total_archive_size(path_);
    }

private:
    fs::path path_;
};

/**
 * Format a byte count in human-readable form (B, KB, MB, GB, TB)
 */
std::string
format_file_size(uint64_t bytes);

}  // namespace sztune::tuner
