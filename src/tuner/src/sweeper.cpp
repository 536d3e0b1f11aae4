#include "sztune/tuner/sweeper.h"
#include "sztune/core/logger.h"
#include "sztune/tuner/candidates.h"

#include <algorithm>

namespace sztune::tuner {

namespace {

// Prefix of `table` ending before the first megabyte candidate above `bound`
std::vector<std::string>
megabyte_prefix(
    const std::vector<std::string>& table,
    std::optional<uint64_t> bound)
{
    if (!bound)
    {
        return table;
    }

    auto end = std::find_if(table.begin(), table.end(), [&](const auto& c) {
        auto mb = megabyte_value(c);
        return mb && *mb > *bound;
    });
    return {table.begin(), end};
}

}  // namespace

std::optional<uint64_t>
dict_size_bound(uint64_t largest_mb)
{
    for (const auto& size : dict_sizes())
    {
        auto mb = megabyte_value(size);
        if (mb && *mb > largest_mb)
        {
            return mb;
        }
    }
    return std::nullopt;
}

std::optional<uint64_t>
block_size_bound(uint64_t largest_mb)
{
    if (largest_mb < 1024)
    {
        return largest_mb;
    }
    return std::nullopt;
}

std::vector<std::string>
bounded_dict_sizes(uint64_t largest_mb)
{
    return megabyte_prefix(dict_sizes(), dict_size_bound(largest_mb));
}

std::vector<std::string>
bounded_block_sizes(uint64_t largest_mb)
{
    return megabyte_prefix(block_sizes(), block_size_bound(largest_mb));
}

std::vector<uint32_t>
thread_counts(uint32_t max_threads)
{
    std::vector<uint32_t> counts;
    for (uint32_t n = std::max<uint32_t>(max_threads, 1); n >= 1; --n)
    {
        counts.push_back(n);
    }
    return counts;
}

ParameterSweeper::ParameterSweeper(CompressorInvoker& invoker)
    : invoker_(invoker)
{
}

SizeTable<std::string>
ParameterSweeper::sweep_dict_sizes(uint64_t largest_mb)
{
    auto candidates = bounded_dict_sizes(largest_mb);
    LOGD(
        "Sweeping ",
        candidates.size(),
        " of ",
        dict_sizes().size(),
        " dictionary sizes");

    SizeTable<std::string> table;
    for (const auto& size : candidates)
    {
        LOGI("Dict size: ", size);

        CompressionParameters params;
        params.dict_size = size;
        table.emplace_back(size, invoker_.measure(params));
        LOGD("  ", table.back().second, " bytes");
    }
    return table;
}

SizeTable<uint32_t>
ParameterSweeper::sweep_word_sizes(const std::string& dict_size)
{
    SizeTable<uint32_t> table;
    for (auto size : word_sizes())
    {
        LOGI("Word size: ", size);

        CompressionParameters params;
        params.dict_size = dict_size;
        params.word_size = size;
        table.emplace_back(size, invoker_.measure(params));
        LOGD("  ", table.back().second, " bytes");
    }
    return table;
}

SizeTable<std::string>
ParameterSweeper::sweep_block_sizes(
    const std::string& dict_size,
    uint32_t word_size,
    uint64_t largest_mb)
{
    auto candidates = bounded_block_sizes(largest_mb);
    LOGD(
        "Sweeping ",
        candidates.size(),
        " of ",
        block_sizes().size(),
        " block sizes");

    SizeTable<std::string> table;
    for (const auto& size : candidates)
    {
        LOGI("Block size: ", size);

        CompressionParameters params;
        params.dict_size = dict_size;
        params.word_size = word_size;
        params.block_size = size;
        table.emplace_back(size, invoker_.measure(params));
        LOGD("  ", table.back().second, " bytes");
    }
    return table;
}

SizeTable<uint32_t>
ParameterSweeper::sweep_threads(
    const std::string& dict_size,
    uint32_t word_size,
    const std::string& block_size,
    uint32_t max_threads)
{
    // Highest count first so it wins ties
    SizeTable<uint32_t> table;
    for (auto threads : thread_counts(max_threads))
    {
        LOGI("Threads: ", threads);

        CompressionParameters params;
        params.dict_size = dict_size;
        params.word_size = word_size;
        params.block_size = block_size;
        params.threads = threads;
        table.emplace_back(threads, invoker_.measure(params));
        LOGD("  ", table.back().second, " bytes");
    }
    return table;
}

}  // namespace sztune::tuner
