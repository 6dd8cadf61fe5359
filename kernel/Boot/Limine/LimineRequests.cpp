#include "LimineRequests.h"

namespace
{
    __attribute__((used, section(".limine_requests_start"))) volatile LIMINE_REQUESTS_START_MARKER;

    __attribute__((used, section(".limine_requests"))) volatile LIMINE_BASE_REVISION(2);

    __attribute__((used, section(".limine_requests"))) volatile limine_memmap_request GMemmapRequest = {
        LIMINE_MEMMAP_REQUEST, 0, nullptr};

    __attribute__((used, section(".limine_requests"))) volatile limine_hhdm_request GHhdmRequest = {
        LIMINE_HHDM_REQUEST, 0, nullptr};

    __attribute__((used, section(".limine_requests"))) volatile limine_executable_file_request GExecutableFileRequest = {
        LIMINE_EXECUTABLE_FILE_REQUEST, 0, nullptr};

    __attribute__((used, section(".limine_requests_end"))) volatile LIMINE_REQUESTS_END_MARKER;

    template <typename T, typename R>
    const T *GetResponse(volatile R &Request)
    {
        return const_cast<const T *>(Request.response);
    }
}

namespace SK::Boot::Limine
{
    bool BaseRevisionSupported()
    {
        return LIMINE_BASE_REVISION_SUPPORTED;
    }

    const limine_memmap_response *GetMemmapResponse()
    {
        return GetResponse<limine_memmap_response>(GMemmapRequest);
    }

    const limine_hhdm_response *GetHhdmResponse()
    {
        return GetResponse<limine_hhdm_response>(GHhdmRequest);
    }

    const char *GetCommandLine()
    {
        const limine_executable_file_response *Response =
            GetResponse<limine_executable_file_response>(GExecutableFileRequest);
        if (!Response || !Response->executable_file || !Response->executable_file->cmdline)
        {
            return "";
        }

        return Response->executable_file->cmdline;
    }

    const char *MemmapTypeName(SC::u64 Type)
    {
        switch (Type)
        {
        case LIMINE_MEMMAP_USABLE:
            return "usable";
        case LIMINE_MEMMAP_RESERVED:
            return "reserved";
        case LIMINE_MEMMAP_ACPI_RECLAIMABLE:
            return "ACPI reclaimable";
        case LIMINE_MEMMAP_ACPI_NVS:
            return "ACPI NVS";
        case LIMINE_MEMMAP_BAD_MEMORY:
            return "bad memory";
        case LIMINE_MEMMAP_BOOTLOADER_RECLAIMABLE:
            return "bootloader reclaimable";
        case LIMINE_MEMMAP_EXECUTABLE_AND_MODULES:
            return "kernel and modules";
        case LIMINE_MEMMAP_FRAMEBUFFER:
            return "framebuffer";
        default:
            return "unknown";
        }
    }
}
