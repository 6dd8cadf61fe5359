#include "Boot/Memory/EarlyMemory.h"

#include "Boot/Limine/LimineRequests.h"
#include "SCLogger.h"
#include "SKMemPageAllocator.h"
#include "SKPanic.h"

namespace SK::Boot::Memory
{
    MemorySummary initialize(SC::usize userPageLimit)
    {
        const limine_memmap_response *memmap = Limine::GetMemmapResponse();
        const limine_hhdm_response *hhdm = Limine::GetHhdmResponse();
        if (!memmap || !hhdm)
            SK::panic("bootloader provided no memory map or HHDM");

        MemorySummary summary;
        SC::u64 bestBase = 0;
        SC::u64 bestLength = 0;

        for (SC::u64 i = 0; i < memmap->entry_count; ++i)
        {
            const limine_memmap_entry *entry = memmap->entries[i];
            SC_LOG_DEBUG("EarlyMemory", "%016lx-%016lx %s", static_cast<unsigned long>(entry->base),
                         static_cast<unsigned long>(entry->base + entry->length),
                         Limine::MemmapTypeName(entry->type));

            if (entry->type != LIMINE_MEMMAP_USABLE)
                continue;

            summary.usableBytes += entry->length;

            SC::u64 base = SC::alignUp(entry->base, SK::Memory::PAGE_SIZE);
            SC::u64 end = SC::alignDown(entry->base + entry->length, SK::Memory::PAGE_SIZE);
            if (end > base && end - base > bestLength)
            {
                bestBase = base;
                bestLength = end - base;
            }
        }

        SC::Logger::instance().print("Skiff booting with %lu kB RAM...",
                                     static_cast<unsigned long>(summary.usableBytes / 1024));

        if (bestLength == 0)
            SK::panic("no usable memory region");

        summary.poolBase = bestBase;
        summary.poolPages = static_cast<SC::usize>(bestLength / SK::Memory::PAGE_SIZE);

        SK::Memory::PageAllocator::instance().initialize(static_cast<SC::VirtAddr>(bestBase + hhdm->offset),
                                                         summary.poolPages, userPageLimit);
        return summary;
    }
}
