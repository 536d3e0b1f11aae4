#pragma once

#include "sztune/tuner/size-probe.h"
#include "sztune/tuner/sweeper.h"

#include <cstdint>
#include <string>
#include <utility>

namespace sztune::tuner {

/**
 * Logical core count, at least 1
 */
uint32_t
default_thread_count();

/**
 * Orchestrator settings
 */
struct TunerOptions
{
    /** First (highest) thread count tried by the thread sweep */
    uint32_t max_threads = default_thread_count();
};

/**
 * Outcome of a full tuning run: the winners, the tables they were picked
 * from and the size of the archives left in the working root.
 */
struct TuningResult
{
    uint64_t largest_directory_mb = 0;

    SizeTable<std::string> dict_table;
    SizeTable<uint32_t> word_table;
    SizeTable<std::string> block_table;
    SizeTable<uint32_t> thread_table;

    std::pair<std::string, uint64_t> best_dict;
    std::pair<uint32_t, uint64_t> best_word;
    std::pair<std::string, uint64_t> best_block;
    std::pair<uint32_t, uint64_t> best_threads;

    uint64_t final_archive_size = 0;

    /** The winning combination as compressor parameters */
    CompressionParameters
    parameters() const;
};

/**
 * Runs the greedy search: dictionary size, then word size, then block size,
 * then thread count, each sweep holding the earlier winners fixed. Earlier
 * choices are never revisited. A final run with all four winners leaves its
 * archives in the working root.
 */
class SweepOrchestrator
{
public:
    SweepOrchestrator(
        CompressorInvoker& invoker,
        SizeProbe& probe,
        TunerOptions options);

    /**
     * @throws TunerError (or a subclass) on the first failure; no partial
     * result is returned
     */
    TuningResult
    run();

private:
    CompressorInvoker& invoker_;
    SizeProbe& probe_;
    TunerOptions options_;
};

}  // namespace sztune::tuner
