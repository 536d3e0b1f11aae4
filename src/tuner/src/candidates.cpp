#include "sztune/tuner/candidates.h"

#include <algorithm>
#include <cctype>

namespace sztune::tuner {

const std::vector<uint32_t>&
word_sizes()
{
    static const std::vector<uint32_t> sizes = {
        8, 12, 16, 24, 32, 48, 64, 96, 128, 192, 256, 273};
    return sizes;
}

const std::vector<std::string>&
dict_sizes()
{
    static const std::vector<std::string> sizes = {
        "64k",  "1m",   "2m",   "3m",   "4m",   "6m",    "8m",   "12m",
        "16m",  "24m",  "32m",  "48m",  "64m",  "96m",   "128m", "192m",
        "256m", "384m", "512m", "768m", "1024m", "1536m"};
    return sizes;
}

const std::vector<std::string>&
block_sizes()
{
    static const std::vector<std::string> sizes = {
        "=off", "=on",  "1m",   "2m",   "3m",   "4m",  "6m",  "8m",
        "12m",  "16m",  "32m",  "64m",  "128m", "256m", "512m", "1g",
        "2g",   "4g",   "8g",   "16g",  "32g",  "64g"};
    return sizes;
}

std::optional<uint64_t>
megabyte_value(const std::string& candidate)
{
    if (candidate.size() < 2 || candidate.back() != 'm')
    {
        return std::nullopt;
    }

    auto digits = candidate.substr(0, candidate.size() - 1);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        }))
    {
        return std::nullopt;
    }

    return std::stoull(digits);
}

bool
is_block_mode(const std::string& candidate)
{
    return candidate == "=off" || candidate == "=on";
}

}  // namespace sztune::tuner
