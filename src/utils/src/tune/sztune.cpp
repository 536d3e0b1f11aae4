#include "sztune/core/logger.h"
#include "sztune/tuner/compressor.h"
#include "sztune/tuner/orchestrator.h"
#include "sztune/tuner/size-probe.h"
#include "sztune/tuner/summary.h"
#include "sztune/tuner/tuner-errors.h"
#include "sztune/utils/tune/arg-options.h"

#include <boost/filesystem.hpp>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace sztune::tuner;
using namespace sztune::utils::tune;

namespace {

/**
 * Resolve the working root, which must be an existing directory
 */
fs::path
resolve_root(const std::string& directory)
{
    fs::path root(directory);
    if (!fs::is_directory(root))
    {
        throw TunerError("Not a directory: " + directory);
    }
    return fs::canonical(root);
}

bool
tune(const CommandLineOptions& options)
{
    try
    {
        auto root = resolve_root(options.directory);

        // Fails here, before any sweep, when the compressor is missing
        SevenZipCompressor compressor(root, options.compressor);
        DuSizeProbe probe(root);
        CompressorInvoker invoker(compressor, root);

        LOGI("Tuning ", compressor.binary().string(), " in ", root.string());
        LOGI("  Max threads: ", options.max_threads);

        auto start_time = std::chrono::steady_clock::now();

        TunerOptions tuner_options;
        tuner_options.max_threads = options.max_threads;
        SweepOrchestrator orchestrator(invoker, probe, tuner_options);
        auto result = orchestrator.run();

        auto duration = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time);
        LOGI("Search finished in ", duration.count(), " s");

        print_summary(result, std::cout);
        return true;
    }
    catch (const TunerError& e)
    {
        LOGE(e.what());
        return false;
    }
    catch (const fs::filesystem_error& e)
    {
        LOGE("Filesystem error: ", e.what());
        return false;
    }
}

}  // namespace

int
main(int argc, char* argv[])
{
    // Parse command line arguments
    CommandLineOptions options = parse_argv(argc, argv);

    // Display help if requested or if there was a parsing error
    if (options.show_help || !options.valid)
    {
        if (!options.valid && options.error_message)
        {
            std::cerr << "Error: " << *options.error_message << std::endl
                      << std::endl;
        }
        std::cout << options.help_text << std::endl;
        return options.valid ? 0 : 1;
    }

    try
    {
        if (!Logger::set_level(options.log_level))
        {
            Logger::set_level(LogLevel::INFO);
            std::cerr << "Unrecognized log level: " << options.log_level
                      << ", falling back to 'info'" << std::endl;
        }

        return tune(options) ? 0 : 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
