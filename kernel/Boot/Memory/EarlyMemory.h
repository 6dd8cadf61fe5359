#pragma once

// SKernel Early Memory - Hands the largest usable RAM region to the page allocator
// Namespace: SK::Boot::Memory

#include "SCTypes.h"

namespace SK::Boot::Memory
{
    struct MemorySummary
    {
        SC::u64 usableBytes = 0;
        SC::PhysAddr poolBase = 0;
        SC::usize poolPages = 0;
    };

    // Panics when the bootloader gave no memory map, no HHDM or no usable region
    MemorySummary initialize(SC::usize userPageLimit);
}
