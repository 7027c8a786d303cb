#pragma once

#include <cstdint>
#include <optional>
#include <random>

// An engine seeded from std::random_device, or from `seed` when one is given
// (tests pin the seed to make loss traces reproducible).
std::mt19937 get_random_engine( std::optional<uint32_t> seed = std::nullopt );
