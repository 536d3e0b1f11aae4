#pragma once

#include "sztune/tuner/workspace.h"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace sztune::tuner {

/**
 * Disk usage of one top-level directory, rounded up to whole megabytes
 */
struct DirectoryUsage
{
    std::string name;
    uint64_t megabytes = 0;
};

/**
 * Measures the input directories to derive sweep bounds.
 */
class SizeProbe
{
public:
    virtual ~SizeProbe() = default;

    /**
     * Largest top-level directory size in megabytes (rounded up)
     *
     * @throws SizeProbeError if the sizes cannot be measured
     */
    virtual uint64_t
    largest_directory_size_mb() = 0;
};

/**
 * SizeProbe backed by `du -sm` run in the working root.
 */
class DuSizeProbe : public SizeProbe
{
public:
    explicit DuSizeProbe(fs::path root, std::string du_program = "du");

    uint64_t
    largest_directory_size_mb() override;

    /** Run the utility and return one entry per input directory */
    std::vector<DirectoryUsage>
    measure() const;

private:
    fs::path root_;
    std::string du_program_;
};

/**
 * Parse `du -sm` summary output, one `<megabytes>\t<path>/` line per entry
 *
 * Blank lines are ignored and the trailing '/' is stripped from names.
 *
 * @throws SizeProbeError on a line that does not match the format
 */
std::vector<DirectoryUsage>
parse_du_output(std::istream& input);

/**
 * Maximum size among `usages`, skipping the virtual environment directory
 *
 * @throws SizeProbeError if no entry remains
 */
uint64_t
largest_usage_mb(const std::vector<DirectoryUsage>& usages);

}  // namespace sztune::tuner
