#pragma once

#include <cstdint>

#include "tidewater/core/config.h"

namespace tidewater {

// Three ships at the port, three customer sites, default parameters.
//
// Distances between the four locations are symmetric, drawn uniformly from
// [200, 800) using `seed`; the diagonal is zero.
ScenarioConfig make_example_scenario(std::uint64_t seed = 42);

} // namespace tidewater
