#include "BootConfig.h"

#include "SCString.h"

namespace SK::Boot::Config
{
    namespace
    {
        constexpr SC::usize TOKEN_SIZE = 96;

        bool isWhitespace(char ch)
        {
            return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
        }

        char toLowerChar(char ch)
        {
            if (ch >= 'A' && ch <= 'Z')
                return static_cast<char>(ch + ('a' - 'A'));
            return ch;
        }

        bool equalsIgnoreCase(const char *a, const char *b)
        {
            if (!a || !b)
                return false;

            while (*a && *b)
            {
                if (toLowerChar(*a) != toLowerChar(*b))
                    return false;
                ++a;
                ++b;
            }

            return *a == '\0' && *b == '\0';
        }

        // Decimal only; rejects empty strings, signs and overflow
        bool parseUnsigned(const char *value, SC::u64 &out)
        {
            if (!value || *value == '\0')
                return false;

            SC::u64 result = 0;
            for (const char *ptr = value; *ptr; ++ptr)
            {
                if (*ptr < '0' || *ptr > '9')
                    return false;

                SC::u64 digit = static_cast<SC::u64>(*ptr - '0');
                if (result > (static_cast<SC::u64>(-1) - digit) / 10)
                    return false;
                result = result * 10 + digit;
            }

            out = result;
            return true;
        }

        void warnValue(const char *key, const char *value)
        {
            SC_LOG_WARN("BootConfig", "ignoring bad value '%s' for %s", value, key);
        }

        bool parseRange(const char *key, const char *value, SC::u32 min, SC::u32 max, SC::u32 &out)
        {
            SC::u64 parsed = 0;
            if (!parseUnsigned(value, parsed) || parsed < min || parsed > max)
            {
                warnValue(key, value);
                return false;
            }

            out = static_cast<SC::u32>(parsed);
            return true;
        }

        void parseLogLevel(const char *value, BootOptions &options)
        {
            if (equalsIgnoreCase(value, "trace"))
                options.logLevel = SC::LogLevel::Trace;
            else if (equalsIgnoreCase(value, "debug"))
                options.logLevel = SC::LogLevel::Debug;
            else if (equalsIgnoreCase(value, "info"))
                options.logLevel = SC::LogLevel::Info;
            else if (equalsIgnoreCase(value, "warn"))
                options.logLevel = SC::LogLevel::Warning;
            else if (equalsIgnoreCase(value, "error"))
                options.logLevel = SC::LogLevel::Error;
            else
                warnValue("log", value);
        }

        void handleOption(char *token, BootOptions &options)
        {
            char *delimiter = nullptr;
            for (char *ptr = token; *ptr; ++ptr)
            {
                if (*ptr == '=')
                {
                    delimiter = ptr;
                    break;
                }
            }

            if (!delimiter)
            {
                SC_LOG_WARN("BootConfig", "ignoring option without value: %s", token);
                return;
            }

            *delimiter = '\0';
            const char *key = token;
            const char *value = delimiter + 1;

            if (equalsIgnoreCase(key, "test"))
            {
                if (*value == '\0' || SC::String::strlen(value) >= TEST_NAME_LENGTH)
                {
                    warnValue(key, value);
                    return;
                }
                SC::String::strncpy(options.testName, value, TEST_NAME_LENGTH);
            }
            else if (equalsIgnoreCase(key, "log"))
            {
                parseLogLevel(value, options);
            }
            else if (equalsIgnoreCase(key, "sched.slice"))
            {
                parseRange(key, value, MIN_TIME_SLICE, MAX_TIME_SLICE, options.timeSlice);
            }
            else if (equalsIgnoreCase(key, "sched.wake"))
            {
                if (equalsIgnoreCase(value, "fifo"))
                    options.wakePolicy = WakePolicy::Fifo;
                else if (equalsIgnoreCase(value, "priority"))
                    options.wakePolicy = WakePolicy::Priority;
                else
                    warnValue(key, value);
            }
            else if (equalsIgnoreCase(key, "timer.hz"))
            {
                parseRange(key, value, MIN_TIMER_HZ, MAX_TIMER_HZ, options.timerHz);
            }
            else if (equalsIgnoreCase(key, "mem.userpages"))
            {
                SC::u64 pages = 0;
                if (!parseUnsigned(value, pages))
                {
                    warnValue(key, value);
                    return;
                }
                options.userPageLimit = static_cast<SC::usize>(pages);
            }
            else if (equalsIgnoreCase(key, "panic"))
            {
                if (equalsIgnoreCase(value, "poweroff"))
                    options.panicAction = PanicAction::PowerOff;
                else if (equalsIgnoreCase(value, "halt"))
                    options.panicAction = PanicAction::Halt;
                else
                    warnValue(key, value);
            }
            else
            {
                SC_LOG_WARN("BootConfig", "ignoring unknown option '%s'", key);
            }
        }
    }

    BootOptions parse(const char *cmdline)
    {
        BootOptions options;
        if (!cmdline)
            return options;

        const char *ptr = cmdline;
        while (*ptr)
        {
            while (*ptr && isWhitespace(*ptr))
                ++ptr;
            if (*ptr == '\0')
                break;

            char token[TOKEN_SIZE];
            SC::usize length = 0;
            bool truncated = false;
            while (*ptr && !isWhitespace(*ptr))
            {
                if (length + 1 < TOKEN_SIZE)
                    token[length++] = *ptr;
                else
                    truncated = true;
                ++ptr;
            }
            token[length] = '\0';

            if (truncated)
            {
                SC_LOG_WARN("BootConfig", "ignoring oversized option '%s...'", token);
                continue;
            }

            handleOption(token, options);
        }

        return options;
    }

    KernelConfig kernelConfig(const BootOptions &options)
    {
        KernelConfig config;
        config.scheduler.timeSlice = options.timeSlice;
        config.scheduler.wakePolicy = options.wakePolicy;
        return config;
    }

    const char *panicActionName(PanicAction action)
    {
        switch (action)
        {
        case PanicAction::PowerOff:
            return "poweroff";
        case PanicAction::Halt:
            return "halt";
        }
        return "unknown";
    }
}
