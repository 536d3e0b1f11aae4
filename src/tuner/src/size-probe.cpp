#include "sztune/tuner/size-probe.h"
#include "sztune/core/logger.h"
#include "sztune/tuner/tuner-errors.h"

#include <boost/process.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace bp = boost::process;

namespace sztune::tuner {

DuSizeProbe::DuSizeProbe(fs::path root, std::string du_program)
    : root_(std::move(root)), du_program_(std::move(du_program))
{
}

uint64_t
DuSizeProbe::largest_directory_size_mb()
{
    auto largest = largest_usage_mb(measure());
    LOGI("Largest input directory: ", largest, " MB");
    return largest;
}

std::vector<DirectoryUsage>
DuSizeProbe::measure() const
{
    auto du = bp::search_path(du_program_);
    if (du.empty())
    {
        throw SizeProbeError(
            "Disk usage utility not found on PATH: " + du_program_);
    }

    // Same set the shell glob `*/` expands to, minus hidden and venv entries
    std::vector<std::string> args = {"-sm", "--"};
    for (const auto& name : list_directories(root_))
    {
        args.push_back(name + "/");
    }
    if (args.size() == 2)
    {
        throw SizeProbeError(
            "No directories to measure in " + root_.string());
    }

    std::vector<DirectoryUsage> usages;
    int exit_code = 0;
    try
    {
        bp::ipstream out;
        bp::child child(
            du,
            bp::args = args,
            bp::std_out > out,
            bp::start_dir = root_.string());

        usages = parse_du_output(out);
        child.wait();
        exit_code = child.exit_code();
    }
    catch (const bp::process_error& e)
    {
        throw SizeProbeError("Failed to run " + du.string(), e);
    }

    if (exit_code != 0)
    {
        throw SizeProbeError(
            du.string() + " exited with status " + std::to_string(exit_code));
    }

    for (const auto& usage : usages)
    {
        LOGD("  ", usage.name, ": ", usage.megabytes, " MB");
    }
    return usages;
}

std::vector<DirectoryUsage>
parse_du_output(std::istream& input)
{
    std::vector<DirectoryUsage> usages;
    std::string line;
    while (std::getline(input, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            continue;
        }

        auto tab = line.find('\t');
        auto size_str = line.substr(0, tab);
        if (tab == std::string::npos || tab + 1 == line.size() ||
            size_str.empty() ||
            !std::all_of(size_str.begin(), size_str.end(), [](unsigned char c) {
                return std::isdigit(c) != 0;
            }))
        {
            throw SizeProbeError("Unparseable disk usage line: '" + line + "'");
        }

        DirectoryUsage usage;
        usage.name = line.substr(tab + 1);
        while (usage.name.size() > 1 && usage.name.back() == '/')
        {
            usage.name.pop_back();
        }

        try
        {
            usage.megabytes = std::stoull(size_str);
        }
        catch (const std::out_of_range& e)
        {
            throw SizeProbeError("Disk usage out of range: '" + line + "'", e);
        }
        usages.push_back(std::move(usage));
    }
    return usages;
}

uint64_t
largest_usage_mb(const std::vector<DirectoryUsage>& usages)
{
    bool found = false;
    uint64_t largest = 0;
    for (const auto& usage : usages)
    {
        // Any path mentioning venv, not only the exact name
        if (usage.name.find(VENV_DIRECTORY) != std::string::npos)
        {
            continue;
        }
        largest = found ? std::max(largest, usage.megabytes) : usage.megabytes;
        found = true;
    }

    if (!found)
    {
        throw SizeProbeError("Disk usage utility reported no directories");
    }
    return largest;
}

}  // namespace sztune::tuner
