#pragma once

// Replaces the global allocation functions of the including test program.
// While fail_large_allocations is set, requests of kLargeAllocation bytes or
// more throw std::bad_alloc. Include from exactly one translation unit.

#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <new>

static std::atomic<bool> fail_large_allocations{false};
static constexpr std::size_t kLargeAllocation = 512 * 1024;

void* operator new(std::size_t size) {
    if (fail_large_allocations.load() && size >= kLargeAllocation)
        throw std::bad_alloc();

    if (void* p = std::malloc(size == 0 ? 1 : size))
        return p;

    throw std::bad_alloc();
}

void operator delete(void* p) noexcept { std::free(p); }
void operator delete(void* p, std::size_t) noexcept { std::free(p); }
