#include "sztune/utils/tune/arg-options.h"
#include "sztune/tuner/orchestrator.h"

#include <boost/program_options.hpp>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;
namespace sztune::utils::tune {

CommandLineOptions
parse_argv(int argc, char* argv[])
{
    CommandLineOptions options;
    options.max_threads = sztune::tuner::default_thread_count();

    // Define command line options with Boost
    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "directory,C",
        po::value<std::string>()->default_value("."),
        "Working directory whose subdirectories are compressed")(
        "compressor",
        po::value<std::string>()->default_value("7z"),
        "7-Zip binary name (searched on PATH) or path")(
        "max-threads",
        po::value<uint32_t>(),
        "Highest thread count tried (default: logical core count)")(
        "log-level,l",
        po::value<std::string>()->default_value("info"),
        "Log level (error, warn, info, debug)");

    // Generate the help text
    std::ostringstream help_stream;
    help_stream << "7-Zip Parameter Tuner" << std::endl
                << "---------------------" << std::endl
                << "Finds the LZMA dictionary size, word size, solid block "
                   "size and thread count"
                << std::endl
                << "giving the smallest archives for a set of directories"
                << std::endl
                << std::endl
                << "Usage: " << (argc > 0 ? argv[0] : "sztune")
                << " [options]" << std::endl
                << desc << std::endl
                << "Every non-hidden subdirectory of the working directory "
                   "(except 'venv') is"
                << std::endl
                << "compressed to <name>.7z once per candidate value. "
                   "Parameters are swept one at a"
                << std::endl
                << "time, each keeping the earlier winners, and the final "
                   "archives are written"
                << std::endl
                << "with the best combination found." << std::endl;
    options.help_text = help_stream.str();

    try
    {
        // Parse command line
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);

        // Check for help flag
        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (vm.count("directory"))
        {
            options.directory = vm["directory"].as<std::string>();
        }

        if (vm.count("compressor"))
        {
            options.compressor = vm["compressor"].as<std::string>();
            if (options.compressor.empty())
            {
                options.valid = false;
                options.error_message = "Compressor must not be empty";
                return options;
            }
        }

        if (vm.count("max-threads"))
        {
            options.max_threads = vm["max-threads"].as<uint32_t>();
            if (options.max_threads == 0)
            {
                options.valid = false;
                options.error_message = "Max threads must be at least 1";
                return options;
            }
        }

        // Get log level
        if (vm.count("log-level"))
        {
            std::string level = vm["log-level"].as<std::string>();
            if (level != "error" && level != "warn" && level != "info" &&
                level != "debug")
            {
                options.valid = false;
                options.error_message =
                    "Log level must be one of: error, warn, info, debug";
                return options;
            }
            options.log_level = level;
        }
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }

    return options;
}

}  // namespace sztune::utils::tune
