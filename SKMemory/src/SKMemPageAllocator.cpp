// SKMemory Page Allocator - Implementation
// Namespace: SK::Memory

#include "SKMemPageAllocator.h"
#include "SKInterrupts.h"
#include "SKPanic.h"
#include "SCLogger.h"
#include "SCString.h"

namespace SK::Memory
{

    namespace
    {
        constexpr const char *LOG_MODULE = "SKMem";
    }

    void PageAllocator::Pool::initialize(const char *poolName, SC::VirtAddr start, SC::usize pages)
    {
        name = poolName;

        SC::usize bitmapPages = SC::divRoundUp(SC::divRoundUp(pages, 8), PAGE_SIZE);
        if (pages <= bitmapPages)
        {
            bitmap = nullptr;
            base = start;
            pageCount = 0;
            freePages = 0;
            SC_LOG_INFO(LOG_MODULE, "0 pages available in %s", name);
            return;
        }

        bitmap = reinterpret_cast<SC::u8 *>(start);
        base = start + bitmapPages * PAGE_SIZE;
        pageCount = pages - bitmapPages;
        freePages = pageCount;
        SC::String::memset(bitmap, 0, (pageCount + 7) / 8);

        SC_LOG_INFO(LOG_MODULE, "%lu pages available in %s", pageCount, name);
    }

    bool PageAllocator::Pool::contains(SC::VirtAddr addr) const
    {
        return pageCount != 0 && addr >= base && addr < base + pageCount * PAGE_SIZE;
    }

    bool PageAllocator::Pool::test(SC::usize page) const
    {
        return (bitmap[page / 8] >> (page % 8)) & 1;
    }

    void PageAllocator::Pool::set(SC::usize page, bool used)
    {
        if (used)
            bitmap[page / 8] |= static_cast<SC::u8>(1 << (page % 8));
        else
            bitmap[page / 8] &= static_cast<SC::u8>(~(1 << (page % 8)));
    }

    SC::usize PageAllocator::Pool::findRun(SC::usize count) const
    {
        SC::usize run = 0;
        for (SC::usize page = 0; page < pageCount; ++page)
        {
            if (test(page))
            {
                run = 0;
                continue;
            }
            if (++run == count)
                return page + 1 - count;
        }
        return pageCount;
    }

    PageAllocator &PageAllocator::instance()
    {
        static PageAllocator instance;
        return instance;
    }

    PageAllocator::PageAllocator()
    {
    }

    void PageAllocator::initialize(SC::VirtAddr base, SC::usize pageCount, SC::usize userPageLimit)
    {
        InterruptGuard guard;

        if (!SC::isAligned(base, PAGE_SIZE))
        {
            panic("page allocator base 0x%lx is not page aligned", base);
        }

        SC::usize userPages = userPageLimit < pageCount / 2 ? userPageLimit : pageCount / 2;
        SC::usize kernelPages = pageCount - userPages;

        m_kernelPool.initialize("kernel pool", base, kernelPages);
        m_userPool.initialize("user pool", base + kernelPages * PAGE_SIZE, userPages);
    }

    void *PageAllocator::allocatePages(SC::usize count, AllocFlags flags)
    {
        if (count == 0)
            return nullptr;

        void *pages = nullptr;
        {
            InterruptGuard guard;
            Pool &pool = poolFor(flags);

            if (count > pool.freePages)
                return nullptr;

            SC::usize first = pool.findRun(count);
            if (first == pool.pageCount)
                return nullptr;

            for (SC::usize page = first; page < first + count; ++page)
            {
                pool.set(page, true);
            }
            pool.freePages -= count;
            pages = reinterpret_cast<void *>(pool.base + first * PAGE_SIZE);
        }

        if (hasFlag(flags, AllocFlags::Zero))
        {
            SC::String::memset(pages, 0, count * PAGE_SIZE);
        }
        return pages;
    }

    void PageAllocator::freePages(void *pages, SC::usize count)
    {
        if (!pages || count == 0)
            return;

        SC::VirtAddr addr = reinterpret_cast<SC::VirtAddr>(pages);

        InterruptGuard guard;

        Pool *pool = m_kernelPool.contains(addr) ? &m_kernelPool
                     : m_userPool.contains(addr) ? &m_userPool
                                                 : nullptr;
        if (!pool || !SC::isAligned(addr, PAGE_SIZE) || !pool->contains(addr + (count - 1) * PAGE_SIZE))
        {
            panic("freeing %lu page(s) at %p that were never allocated", count, pages);
        }

        SC::usize first = (addr - pool->base) / PAGE_SIZE;
        for (SC::usize page = first; page < first + count; ++page)
        {
            if (!pool->test(page))
            {
                panic("double free of page %p in %s",
                      reinterpret_cast<void *>(pool->base + page * PAGE_SIZE), pool->name);
            }
        }

        // Poison to expose use-after-free
        SC::String::memset(pages, FREED_PAGE_POISON, count * PAGE_SIZE);

        for (SC::usize page = first; page < first + count; ++page)
        {
            pool->set(page, false);
        }
        pool->freePages += count;
    }

    SC::usize PageAllocator::freePageCount(AllocFlags pool) const
    {
        return poolFor(pool).freePages;
    }

    SC::usize PageAllocator::totalPageCount(AllocFlags pool) const
    {
        return poolFor(pool).pageCount;
    }

} // namespace SK::Memory
