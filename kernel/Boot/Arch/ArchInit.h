#pragma once

namespace SK::Boot::Arch
{
    // CPU identification, GDT with TSS, IDT. Interrupts stay disabled.
    void InitCpuGdtIdt();
}
