#pragma once

#include "sztune/tuner/orchestrator.h"

#include <ostream>

namespace sztune::tuner {

/**
 * Print every sweep table in iteration order, marking each winner with '*',
 * followed by the winning flags and the final archive size.
 */
void
print_summary(const TuningResult& result, std::ostream& os);

}  // namespace sztune::tuner
