#include "ArchInit.h"

#include "SArchCPU.h"
#include "SArchGDT.h"
#include "SArchIDT.h"
#include "SCLogger.h"

namespace SK::Boot::Arch
{
    void InitCpuGdtIdt()
    {
        SArch::CPU &cpu = SArch::CPU::instance();
        cpu.initialize();
        SC_LOG_DEBUG("ArchInit", "Vendor: %s", cpu.vendorString());

        SArch::GDT::instance().initialize();
        SC_LOG_DEBUG("ArchInit", "GDT initialized");

        SArch::IDT::instance().initialize();
        SC_LOG_DEBUG("ArchInit", "IDT initialized");
    }
}
