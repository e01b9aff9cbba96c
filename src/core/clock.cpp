#include "clock.h"

#include <chrono>

namespace core {

uint64_t system_now() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
}

} // namespace core
