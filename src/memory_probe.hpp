#pragma once
#include <cstddef>
#include <functional>

// Returns the resident set size of this process in bytes, 0 when unavailable.
using MemoryReader = std::function<size_t()>;

size_t read_resident_bytes();

// Asks the allocator to hand freed pages back to the OS. Best effort.
void release_free_memory();
