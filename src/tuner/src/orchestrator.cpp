#include "sztune/tuner/orchestrator.h"
#include "sztune/core/logger.h"

#include <thread>

namespace sztune::tuner {

uint32_t
default_thread_count()
{
    auto cores = std::thread::hardware_concurrency();
    return cores > 0 ? cores : 1;
}

CompressionParameters
TuningResult::parameters() const
{
    CompressionParameters params;
    params.dict_size = best_dict.first;
    params.word_size = best_word.first;
    params.block_size = best_block.first;
    params.threads = best_threads.first;
    return params;
}

SweepOrchestrator::SweepOrchestrator(
    CompressorInvoker& invoker,
    SizeProbe& probe,
    TunerOptions options)
    : invoker_(invoker), probe_(probe), options_(options)
{
}

TuningResult
SweepOrchestrator::run()
{
    TuningResult result;

    auto stale = invoker_.remove_archives();
    if (stale > 0)
    {
        LOGW("Removed ", stale, " leftover archive(s) from the working root");
    }

    // Directory contents do not change during a run, probe once for both
    // bounds
    result.largest_directory_mb = probe_.largest_directory_size_mb();

    ParameterSweeper sweeper(invoker_);

    result.dict_table = sweeper.sweep_dict_sizes(result.largest_directory_mb);
    result.best_dict = smallest(result.dict_table);
    LOGI(
        COLORED(GREEN, "Best dict size: "),
        result.best_dict.first,
        " (",
        result.best_dict.second,
        " bytes)");

    result.word_table = sweeper.sweep_word_sizes(result.best_dict.first);
    result.best_word = smallest(result.word_table);
    LOGI(
        COLORED(GREEN, "Best word size: "),
        result.best_word.first,
        " (",
        result.best_word.second,
        " bytes)");

    result.block_table = sweeper.sweep_block_sizes(
        result.best_dict.first,
        result.best_word.first,
        result.largest_directory_mb);
    result.best_block = smallest(result.block_table);
    LOGI(
        COLORED(GREEN, "Best block size: "),
        result.best_block.first,
        " (",
        result.best_block.second,
        " bytes)");

    result.thread_table = sweeper.sweep_threads(
        result.best_dict.first,
        result.best_word.first,
        result.best_block.first,
        options_.max_threads);
    result.best_threads = smallest(result.thread_table);
    LOGI(
        COLORED(GREEN, "Best thread count: "),
        result.best_threads.first,
        " (",
        result.best_threads.second,
        " bytes)");

    auto params = result.parameters();
    LOGI("Testing done! Compressing with best values: ", describe(params));
    invoker_.run_all(params);

    result.final_archive_size = invoker_.total_archive_size();
    if (result.final_archive_size == 0)
    {
        throw CompressorError(
            "Final run produced no archives in " + invoker_.root().string());
    }
    LOGI(
        COLORED(BOLD_GREEN, "Final archives: "),
        format_file_size(result.final_archive_size));

    return result;
}

}  // namespace sztune::tuner
