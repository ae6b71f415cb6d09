#pragma once
#include "types.hpp"

Time_t utc_now_ms();

inline Clock system_clock() {
    return [] { return utc_now_ms(); };
}
