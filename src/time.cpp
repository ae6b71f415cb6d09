#include "time.hpp"

#if defined(_WIN32)

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>

Time_t utc_now_ms() {
    FILETIME ft;
    GetSystemTimePreciseAsFileTime(&ft);

    // 100ns ticks since 1601-01-01
    Time_t t = (Time_t(ft.dwHighDateTime) << 32) | Time_t(ft.dwLowDateTime);

    return t / 10'000 - 11'644'473'600'000LL;
}

#elif defined(__APPLE__) || defined(__linux__)

#include <time.h>

Time_t utc_now_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);

    return Time_t(ts.tv_sec) * 1'000 + Time_t(ts.tv_nsec) / 1'000'000;
}

#else
#error "Unsupported platform"
#endif
