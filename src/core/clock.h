#pragma once

#include <cstdint>
#include <functional>

namespace core {

/**
 * Source of the current time in Unix seconds.
 * Expiry checks go through this so tests can move time.
 */
using Clock = std::function<uint64_t()>;

/**
 * Wall clock, Unix seconds
 */
uint64_t system_now();

} // namespace core
