#pragma once

// SCommon Logger - leveled, module-tagged log lines handed to one sink
// Namespace: SC

#include "SCTypes.h"
#include <cstdarg>

namespace SC
{

    enum class LogLevel : u8
    {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Fatal = 5
    };

    const char *logLevelName(LogLevel level);

    // Receives one complete, NUL-terminated line (including the trailing '\n')
    using LogOutputFn = void (*)(const char *line);

    class Logger
    {
    public:
        static constexpr usize LINE_SIZE = 256;

        static Logger &instance();

        // Lines below the level are dropped before formatting
        void setLevel(LogLevel level);
        LogLevel level() const { return m_level; }

        // Until a sink is installed every line is discarded
        void setOutput(LogOutputFn output);

        // Emits "[LEVEL] module: message\n"
        void log(LogLevel level, const char *module, const char *format, ...);
        void vlog(LogLevel level, const char *module, const char *format, va_list args);

        // Raw line without level prefix; not filtered by level
        void print(const char *format, ...);

        // printf-style formatting into buffer; always NUL-terminates, truncates silently.
        // Returns the number of characters written (excluding NUL).
        static usize format(char *buffer, usize size, const char *format, ...);
        static usize vformat(char *buffer, usize size, const char *format, va_list args);

    private:
        Logger();
        ~Logger() = default;
        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;

        void emit(const char *line);

        LogLevel m_level;
        LogOutputFn m_output;
    };

#define SC_LOG(level, module, fmt, ...) SC::Logger::instance().log(SC::LogLevel::level, module, fmt, ##__VA_ARGS__)
#define SC_LOG_TRACE(module, fmt, ...) SC_LOG(Trace, module, fmt, ##__VA_ARGS__)
#define SC_LOG_DEBUG(module, fmt, ...) SC_LOG(Debug, module, fmt, ##__VA_ARGS__)
#define SC_LOG_INFO(module, fmt, ...) SC_LOG(Info, module, fmt, ##__VA_ARGS__)
#define SC_LOG_WARN(module, fmt, ...) SC_LOG(Warning, module, fmt, ##__VA_ARGS__)
#define SC_LOG_ERROR(module, fmt, ...) SC_LOG(Error, module, fmt, ##__VA_ARGS__)
#define SC_LOG_FATAL(module, fmt, ...) SC_LOG(Fatal, module, fmt, ##__VA_ARGS__)

} // namespace SC
