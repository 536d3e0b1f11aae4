#include "sztune/tuner/compressor.h"
#include "sztune/core/logger.h"
#include "sztune/tuner/tuner-errors.h"

#include <boost/process.hpp>
#include <sstream>

namespace bp = boost::process;

namespace sztune::tuner {

std::vector<std::string>
build_command_args(
    const CompressionParameters& params,
    const std::string& archive,
    const std::string& directory)
{
    std::vector<std::string> args = {"a", MAX_LEVEL_FLAG};

    if (params.dict_size && !params.dict_size->empty())
    {
        args.push_back("-md" + *params.dict_size);
    }
    if (params.word_size && *params.word_size != 0)
    {
        args.push_back("-mfb" + std::to_string(*params.word_size));
    }
    if (params.block_size && !params.block_size->empty())
    {
        args.push_back("-ms" + *params.block_size);
    }
    if (params.threads && *params.threads != 0)
    {
        args.push_back("-mmt" + std::to_string(*params.threads));
    }

    args.push_back("--");
    args.push_back(archive);
    args.push_back(directory);
    return args;
}

std::string
describe(const CompressionParameters& params)
{
    // Everything from the level flag up to the "--" separator
    auto args = build_command_args(params, "", "");
    std::ostringstream oss;
    oss << args[1];
    for (size_t i = 2; i < args.size() - 3; ++i)
    {
        oss << " " << args[i];
    }
    return oss.str();
}

fs::path
SevenZipCompressor::locate(const std::string& program)
{
    if (program.find('/') != std::string::npos)
    {
        fs::path path(program);
        if (!fs::is_regular_file(path))
        {
            throw CompressorError("Compressor binary not found: " + program);
        }
        return fs::absolute(path);
    }

    auto path = bp::search_path(program);
    if (path.empty())
    {
        throw CompressorError(program + " binary could not be found!");
    }
    return path;
}

SevenZipCompressor::SevenZipCompressor(
    fs::path root,
    const std::string& program)
    : root_(std::move(root)), binary_(locate(program))
{
    LOGD("Using compressor ", binary_.string());
}

void
SevenZipCompressor::compress(
    const CompressionParameters& params,
    const std::vector<std::string>& directories,
    const fs::path& output_dir)
{
    const bool in_root = output_dir == root_;
    for (const auto& directory : directories)
    {
        auto archive_name = directory + ARCHIVE_EXTENSION;
        auto archive = in_root
            ? archive_name
            : (fs::absolute(output_dir) / archive_name).string();
        auto args = build_command_args(params, archive, directory);

        LOGD("Running ", binary_.string(), " on ", directory);

        int exit_code = 0;
        try
        {
            bp::child child(
                binary_,
                bp::args = args,
                bp::std_out > bp::null,
                bp::start_dir = root_.string());
            child.wait();
            exit_code = child.exit_code();
        }
        catch (const bp::process_error& e)
        {
            throw CompressorError(
                "Failed to run " + binary_.string() + " on " + directory, e);
        }

        if (exit_code != 0)
        {
            throw CompressorError(
                binary_.string() + " exited with status " +
                std::to_string(exit_code) + " while compressing " + directory);
        }
    }
}

CompressorInvoker::CompressorInvoker(Compressor& compressor, fs::path root)
    : compressor_(compressor), root_(std::move(root))
{
}

void
CompressorInvoker::run_all(
    const CompressionParameters& params,
    const fs::path& output_dir)
{
    auto directories = list_directories(root_);
    if (directories.empty())
    {
        throw SweepError("No directories to compress in " + root_.string());
    }

    compressor_.compress(params, directories, output_dir);
}

uint64_t
CompressorInvoker::measure(const CompressionParameters& params)
{
    ArchiveScope scope(root_);
    run_all(params, scope.path());

    auto total = scope.archive_size();
    if (total == 0)
    {
        throw CompressorError(
            "Compressor produced no archives for " + describe(params));
    }
    return total;
}

}  // namespace sztune::tuner
