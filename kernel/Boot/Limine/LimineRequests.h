#pragma once

#include "SCTypes.h"

#ifndef LIMINE_API_REVISION
#define LIMINE_API_REVISION 2
#endif
#include "limine.h"

namespace SK::Boot::Limine
{
    // False when the bootloader did not accept our base revision
    bool BaseRevisionSupported();

    const limine_memmap_response *GetMemmapResponse();
    const limine_hhdm_response *GetHhdmResponse();

    // Kernel command line, or an empty string when the bootloader gave none
    const char *GetCommandLine();

    const char *MemmapTypeName(SC::u64 Type);
}
