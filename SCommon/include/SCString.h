#pragma once

// SCommon String - Freestanding string and memory helpers
// Namespace: SC::String

#include "SCTypes.h"

namespace SC::String
{

    usize strlen(const char *str);
    // Always NUL-terminates when n > 0
    void strncpy(char *dest, const char *src, usize n);
    i32 strcmp(const char *a, const char *b);
    i32 strncmp(const char *a, const char *b, usize n);
    void memset(void *dest, u8 value, usize size);
    void memcpy(void *dest, const void *src, usize size);
    i32 memcmp(const void *a, const void *b, usize size);

} // namespace SC::String
