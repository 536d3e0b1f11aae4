#include "sztune/tuner/summary.h"

#include <iomanip>
#include <sstream>
#include <string>

namespace sztune::tuner {

namespace {

template <typename T>
void
print_table(
    std::ostream& os,
    const std::string& title,
    const SizeTable<T>& table,
    const T& winner)
{
    os << title << std::endl;
    for (const auto& [candidate, bytes] : table)
    {
        std::ostringstream key;
        key << candidate;
        os << "  " << std::left << std::setw(8) << key.str() << std::right
           << std::setw(16) << bytes << (candidate == winner ? "  *" : "")
           << std::endl;
    }
}

}  // namespace

void
print_summary(const TuningResult& result, std::ostream& os)
{
    os << "Largest input directory: " << result.largest_directory_mb << " MB"
       << std::endl
       << std::endl;

    print_table(
        os, "Dictionary size (-md)", result.dict_table, result.best_dict.first);
    print_table(os, "Word size (-mfb)", result.word_table, result.best_word.first);
    print_table(
        os, "Block size (-ms)", result.block_table, result.best_block.first);
    print_table(
        os, "Threads (-mmt)", result.thread_table, result.best_threads.first);

    os << std::endl
       << "Best flags: " << describe(result.parameters()) << std::endl
       << "Final archives: " << format_file_size(result.final_archive_size)
       << " (" << result.final_archive_size << " bytes)" << std::endl;
}

}  // namespace sztune::tuner
