#pragma once

// SCommon Types - integer aliases, status codes and alignment helpers
// Namespace: SC

#include <cstdint>
#include <cstddef>

namespace SC
{

    using u8 = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    using usize = size_t;
    using uptr = uintptr_t;

    // Physical addresses come from the bootloader memory map; virtual ones
    // are what the kernel dereferences after the HHDM offset is applied
    using PhysAddr = u64;
    using VirtAddr = u64;

    enum class Status : i32
    {
        Success = 0,
        Error = -1,
        InvalidParam = -2,
        OutOfMemory = -3,
        NotFound = -4,
        Timeout = -5,
        Busy = -6,
        NotSupported = -7
    };

    const char *statusName(Status status);

    // A value paired with the status that produced it. value is only
    // meaningful when ok() holds.
    template <typename T>
    struct Result
    {
        T value;
        Status status;

        bool ok() const { return status == Status::Success; }
        explicit operator bool() const { return ok(); }
    };

    // Power-of-two alignment; align must be a power of two
    constexpr u64 alignDown(u64 value, u64 align)
    {
        return value & ~(align - 1);
    }

    constexpr u64 alignUp(u64 value, u64 align)
    {
        return alignDown(value + align - 1, align);
    }

    constexpr bool isAligned(u64 value, u64 align)
    {
        return (value & (align - 1)) == 0;
    }

    constexpr u64 divRoundUp(u64 value, u64 divisor)
    {
        return (value + divisor - 1) / divisor;
    }

} // namespace SC
