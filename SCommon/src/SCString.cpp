// SCommon String - Implementation
// Namespace: SC::String

#include "SCString.h"

namespace SC
{

    const char *statusName(Status status)
    {
        switch (status)
        {
        case Status::Success:
            return "Success";
        case Status::Error:
            return "Error";
        case Status::InvalidParam:
            return "InvalidParam";
        case Status::OutOfMemory:
            return "OutOfMemory";
        case Status::NotFound:
            return "NotFound";
        case Status::Timeout:
            return "Timeout";
        case Status::Busy:
            return "Busy";
        case Status::NotSupported:
            return "NotSupported";
        }
        return "Unknown";
    }

    namespace String
    {

        usize strlen(const char *str)
        {
            if (!str)
                return 0;

            usize len = 0;
            while (str[len])
                ++len;
            return len;
        }

        void strncpy(char *dest, const char *src, usize n)
        {
            if (n == 0)
                return;

            usize i = 0;
            if (src)
            {
                for (; i + 1 < n && src[i]; ++i)
                {
                    dest[i] = src[i];
                }
            }
            dest[i] = '\0';
        }

        i32 strcmp(const char *a, const char *b)
        {
            while (*a && *a == *b)
            {
                ++a;
                ++b;
            }
            return static_cast<u8>(*a) - static_cast<u8>(*b);
        }

        i32 strncmp(const char *a, const char *b, usize n)
        {
            for (usize i = 0; i < n; ++i)
            {
                if (a[i] != b[i] || !a[i])
                    return static_cast<u8>(a[i]) - static_cast<u8>(b[i]);
            }
            return 0;
        }

        void memset(void *dest, u8 value, usize size)
        {
            u8 *d = static_cast<u8 *>(dest);
            while (size--)
            {
                *d++ = value;
            }
        }

        void memcpy(void *dest, const void *src, usize size)
        {
            u8 *d = static_cast<u8 *>(dest);
            const u8 *s = static_cast<const u8 *>(src);
            while (size--)
            {
                *d++ = *s++;
            }
        }

        i32 memcmp(const void *a, const void *b, usize size)
        {
            const u8 *p1 = static_cast<const u8 *>(a);
            const u8 *p2 = static_cast<const u8 *>(b);
            while (size--)
            {
                if (*p1 != *p2)
                    return *p1 - *p2;
                ++p1;
                ++p2;
            }
            return 0;
        }

    } // namespace String

} // namespace SC
