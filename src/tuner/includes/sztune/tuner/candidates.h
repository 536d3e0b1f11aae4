#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sztune::tuner {

/**
 * Static, ordered candidate tables for every swept compressor parameter.
 *
 * Each table is in ascending magnitude order and is never mutated; sweeps
 * iterate a prefix of it.
 */

/** Match-finder word sizes (`-mfb`). 273 is the LZMA maximum. */
const std::vector<uint32_t>&
word_sizes();

/** Dictionary sizes (`-md`), 64k to 1536m. */
const std::vector<std::string>&
dict_sizes();

/** Solid block sizes (`-ms`): the `=off`/`=on` modes, then 1m to 64g. */
const std::vector<std::string>&
block_sizes();

/**
 * Numeric megabyte value of an `m`-suffixed candidate such as `"48m"`.
 *
 * @return The value, or empty for `k`/`g` suffixes, block modes and
 * anything that is not a plain `<digits>m` string
 */
std::optional<uint64_t>
megabyte_value(const std::string& candidate);

/** True for the two block-size modes `=off` and `=on` */
bool
is_block_mode(const std::string& candidate);

}  // namespace sztune::tuner
