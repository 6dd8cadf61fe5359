/**
 * @file SCxxAbi.cpp
 * @brief C and C++ runtime symbols for the freestanding kernel image
 *
 * The compiler emits calls to these even with -ffreestanding:
 * - Static-local initialization guards
 * - Static destructor registration
 * - memset/memcpy/memmove/memcmp for aggregate copies and zeroing
 */

#include "SCTypes.h"

extern "C"
{

    void *__dso_handle = nullptr;

    // Single core; callers of instance() never race their own first use
    int __cxa_guard_acquire(long long *guard)
    {
        return *reinterpret_cast<char *>(guard) ? 0 : 1;
    }

    void __cxa_guard_release(long long *guard)
    {
        *reinterpret_cast<char *>(guard) = 1;
    }

    void __cxa_guard_abort(long long *guard)
    {
        *reinterpret_cast<char *>(guard) = 0;
    }

    // The kernel never returns from kernel_main, so destructors never run
    int __cxa_atexit(void (*destructor)(void *), void *arg, void *dso)
    {
        (void)destructor;
        (void)arg;
        (void)dso;
        return 0;
    }

    void __cxa_pure_virtual()
    {
        asm volatile("cli");
        while (true)
        {
            asm volatile("hlt");
        }
    }

    void *memset(void *dest, int value, SC::usize size)
    {
        SC::u8 *d = static_cast<SC::u8 *>(dest);
        while (size--)
        {
            *d++ = static_cast<SC::u8>(value);
        }
        return dest;
    }

    void *memcpy(void *dest, const void *src, SC::usize size)
    {
        SC::u8 *d = static_cast<SC::u8 *>(dest);
        const SC::u8 *s = static_cast<const SC::u8 *>(src);
        while (size--)
        {
            *d++ = *s++;
        }
        return dest;
    }

    void *memmove(void *dest, const void *src, SC::usize size)
    {
        SC::u8 *d = static_cast<SC::u8 *>(dest);
        const SC::u8 *s = static_cast<const SC::u8 *>(src);
        if (d < s)
        {
            while (size--)
            {
                *d++ = *s++;
            }
        }
        else if (d > s)
        {
            d += size;
            s += size;
            while (size--)
            {
                *--d = *--s;
            }
        }
        return dest;
    }

    int memcmp(const void *a, const void *b, SC::usize size)
    {
        const SC::u8 *p1 = static_cast<const SC::u8 *>(a);
        const SC::u8 *p2 = static_cast<const SC::u8 *>(b);
        while (size--)
        {
            if (*p1 != *p2)
                return *p1 - *p2;
            ++p1;
            ++p2;
        }
        return 0;
    }

} // extern "C"
