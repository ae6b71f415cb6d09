#include "memory_probe.hpp"

#include <fstream>

#if defined(__linux__)
#include <malloc.h>
#include <unistd.h>
#endif

size_t read_resident_bytes() {
#if defined(__linux__)
    std::ifstream statm("/proc/self/statm");
    size_t total_pages = 0;
    size_t resident_pages = 0;
    if (!(statm >> total_pages >> resident_pages)) {
        return 0;
    }
    const long page_size = sysconf(_SC_PAGESIZE);
    return page_size > 0 ? resident_pages * static_cast<size_t>(page_size) : 0;
#else
    return 0;
#endif
}

void release_free_memory() {
#if defined(__GLIBC__)
    malloc_trim(0);
#endif
}
