#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sztune::utils::tune {

/**
 * Type-safe structure for command line options
 */
struct CommandLineOptions
{
    /** Working root holding the directories to compress */
    std::string directory = ".";

    /** Compressor binary name (looked up on PATH) or path */
    std::string compressor = "7z";

    /** Highest thread count tried; defaults to the logical core count */
    uint32_t max_threads = 1;

    /** Log verbosity level */
    std::string log_level = "info";

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;
};

/**
 * Parse command line arguments into a structured options object
 *
 * @param argc Argument count from main
 * @param argv Argument values from main
 * @return A populated CommandLineOptions structure
 */
CommandLineOptions
parse_argv(int argc, char* argv[]);

}  // namespace sztune::utils::tune
