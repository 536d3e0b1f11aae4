#pragma once

#include "sztune/tuner/workspace.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sztune::tuner {

/** Compression level used for every run, never swept */
inline constexpr const char* MAX_LEVEL_FLAG = "-mx9";

/**
 * One parameter combination. Unset values fall back to the compressor's
 * own defaults.
 */
struct CompressionParameters
{
    std::optional<std::string> dict_size;
    std::optional<uint32_t> word_size;
    std::optional<std::string> block_size;
    std::optional<uint32_t> threads;
};

/**
 * Build the argument list for one archive, excluding the program itself:
 * `a -mx9 [-md<dict>] [-mfb<word>] [-ms<block>] [-mmt<threads>] -- <archive>
 * <directory>`
 *
 * Only present, non-empty and non-zero parameters become flags.
 */
std::vector<std::string>
build_command_args(
    const CompressionParameters& params,
    const std::string& archive,
    const std::string& directory);

/** Human-readable flag summary such as `-md4m -mfb32` */
std::string
describe(const CompressionParameters& params);

/**
 * Produces one `<directory>.7z` archive per input directory.
 */
class Compressor
{
public:
    virtual ~Compressor() = default;

    /**
     * Compress every directory in `directories` (names relative to the
     * working root) into `output_dir`, blocking until all runs finish.
     *
     * @throws CompressorError if any run fails
     */
    virtual void
    compress(
        const CompressionParameters& params,
        const std::vector<std::string>& directories,
        const fs::path& output_dir) = 0;
};

/**
 * Compressor that runs the 7-Zip command line tool as a child process.
 */
class SevenZipCompressor : public Compressor
{
public:
    /**
     * @param root Working root, used as the child's current directory
     * @param program Binary name looked up on PATH, or a path to it
     * @throws CompressorError if the binary cannot be found
     */
    SevenZipCompressor(fs::path root, const std::string& program = "7z");

    void
    compress(
        const CompressionParameters& params,
        const std::vector<std::string>& directories,
        const fs::path& output_dir) override;

    const fs::path&
    binary() const
    {
        return binary_;
    }

    /**
     * Resolve `program` to an executable path
     *
     * @throws CompressorError if it is neither an existing file nor on PATH
     */
    static fs::path
    locate(const std::string& program);

private:
    fs::path root_;
    fs::path binary_;
};

/**
 * Runs one batch over the current input directories and measures it.
 */
class CompressorInvoker
{
public:
    CompressorInvoker(Compressor& compressor, fs::path root);

    /**
     * Compress every current input directory into `output_dir` with the same
     * parameter set
     *
     * @throws SweepError if there is nothing to compress
     * @throws CompressorError if the compressor fails
     */
    void
    run_all(const CompressionParameters& params, const fs::path& output_dir);

    /** run_all into the working root itself */
    void
    run_all(const CompressionParameters& params)
    {
        run_all(params, root_);
    }

    /**
     * run_all into a fresh ArchiveScope and return the total archive size.
     * The scope is released before returning.
     *
     * @throws CompressorError if no archive bytes were produced
     */
    uint64_t
    measure(const CompressionParameters& params);

    uint64_t
    total_archive_size() const
    {
        return tuner::total_archive_size(root_);
    }

    size_t
    remove_archives() const
    {
        return tuner::remove_archives(root_);
    }

    const fs::path&
    root() const
    {
        return root_;
    }

private:
    Compressor& compressor_;
    fs::path root_;
};

}  // namespace sztune::tuner
