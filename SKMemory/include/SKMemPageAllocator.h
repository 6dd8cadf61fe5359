#pragma once

// SKMemory Page Allocator - Page-granular kernel and user pools
// Namespace: SK::Memory

#include "SCTypes.h"

namespace SK::Memory
{

    constexpr SC::usize PAGE_SIZE = 4096;

    enum class AllocFlags : SC::u8
    {
        None = 0,
        // Fill the pages with zeros
        Zero = 1 << 0,
        // Take the pages from the user pool
        User = 1 << 1
    };

    inline AllocFlags operator|(AllocFlags a, AllocFlags b)
    {
        return static_cast<AllocFlags>(static_cast<SC::u8>(a) | static_cast<SC::u8>(b));
    }

    inline bool hasFlag(AllocFlags flags, AllocFlags flag)
    {
        return (static_cast<SC::u8>(flags) & static_cast<SC::u8>(flag)) != 0;
    }

    // Fill pattern for freed pages
    constexpr SC::u8 FREED_PAGE_POISON = 0xcc;

    class PageAllocator
    {
    public:
        static PageAllocator &instance();

        // Splits [base, base + pageCount pages) into a kernel pool and a user
        // pool of at most userPageLimit pages (and never more than half).
        // base must be page aligned and mapped.
        void initialize(SC::VirtAddr base, SC::usize pageCount, SC::usize userPageLimit);

        // count contiguous pages, or nullptr
        void *allocatePages(SC::usize count, AllocFlags flags = AllocFlags::None);
        void *allocatePage(AllocFlags flags = AllocFlags::None) { return allocatePages(1, flags); }

        // Freeing a range that is not allocated is fatal
        void freePages(void *pages, SC::usize count);
        void freePage(void *page) { freePages(page, 1); }

        SC::usize freePageCount(AllocFlags pool = AllocFlags::None) const;
        SC::usize totalPageCount(AllocFlags pool = AllocFlags::None) const;

    private:
        PageAllocator();
        ~PageAllocator() = default;
        PageAllocator(const PageAllocator &) = delete;
        PageAllocator &operator=(const PageAllocator &) = delete;

        struct Pool
        {
            const char *name = nullptr;
            // Bitmap occupies the first pages of the pool region; 1 = in use
            SC::u8 *bitmap = nullptr;
            SC::VirtAddr base = 0;
            SC::usize pageCount = 0;
            SC::usize freePages = 0;

            void initialize(const char *poolName, SC::VirtAddr start, SC::usize pages);
            bool contains(SC::VirtAddr addr) const;
            bool test(SC::usize page) const;
            void set(SC::usize page, bool used);
            // Index of the first page of a free run, or pageCount if none
            SC::usize findRun(SC::usize count) const;
        };

        Pool &poolFor(AllocFlags flags) { return hasFlag(flags, AllocFlags::User) ? m_userPool : m_kernelPool; }
        const Pool &poolFor(AllocFlags flags) const { return hasFlag(flags, AllocFlags::User) ? m_userPool : m_kernelPool; }

        Pool m_kernelPool;
        Pool m_userPool;
    };

} // namespace SK::Memory
