#pragma once

#include "sztune/tuner/compressor.h"
#include "sztune/tuner/tuner-errors.h"

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sztune::tuner {

/**
 * Measured total archive size per candidate, in sweep iteration order.
 * Entries are appended once a candidate's run completes and never changed.
 */
template <typename T>
using SizeTable = std::vector<std::pair<T, uint64_t>>;

/**
 * Pick the candidate with the smallest measured size
 *
 * On ties the first minimal entry in iteration order wins.
 *
 * @throws SweepError if the table is empty
 */
template <typename T>
std::pair<T, uint64_t>
smallest(const SizeTable<T>& table)
{
    if (table.empty())
    {
        throw SweepError("Cannot pick a winner from an empty sweep");
    }

    auto best = table.begin();
    for (auto it = std::next(table.begin()); it != table.end(); ++it)
    {
        if (it->second < best->second)
        {
            best = it;
        }
    }
    return *best;
}

/**
 * Smallest `m`-suffixed dictionary size exceeding `largest_mb`
 *
 * @return The bound in megabytes, or empty if every dictionary size is at
 * most `largest_mb`
 */
std::optional<uint64_t>
dict_size_bound(uint64_t largest_mb);

/**
 * Block-size bound: `largest_mb` itself when it is below 1024, otherwise
 * empty
 */
std::optional<uint64_t>
block_size_bound(uint64_t largest_mb);

/**
 * Dictionary candidates to sweep: the table prefix ending before the first
 * megabyte candidate above dict_size_bound(). Non-megabyte entries never
 * end the prefix.
 */
std::vector<std::string>
bounded_dict_sizes(uint64_t largest_mb);

/**
 * Block candidates to sweep: the table prefix ending before the first
 * megabyte candidate above block_size_bound(). Block modes and gigabyte
 * entries never end the prefix.
 */
std::vector<std::string>
bounded_block_sizes(uint64_t largest_mb);

/** Thread counts from `max_threads` down to 1 */
std::vector<uint32_t>
thread_counts(uint32_t max_threads);

/**
 * Greedy single-parameter sweeps. Each candidate is measured once in its
 * own scratch scope with every previously decided parameter held fixed.
 */
class ParameterSweeper
{
public:
    explicit ParameterSweeper(CompressorInvoker& invoker);

    SizeTable<std::string>
    sweep_dict_sizes(uint64_t largest_mb);

    SizeTable<uint32_t>
    sweep_word_sizes(const std::string& dict_size);

    SizeTable<std::string>
    sweep_block_sizes(
        const std::string& dict_size,
        uint32_t word_size,
        uint64_t largest_mb);

    SizeTable<uint32_t>
    sweep_threads(
        const std::string& dict_size,
        uint32_t word_size,
        const std::string& block_size,
        uint32_t max_threads);

private:
    CompressorInvoker& invoker_;
};

}  // namespace sztune::tuner
