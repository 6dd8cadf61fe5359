// SCommon Logger - line formatting and level filtering
// Namespace: SC

#include "SCLogger.h"
#include <cstdarg>

namespace SC
{

    namespace
    {
        // Bounded output cursor over a caller-supplied buffer
        struct LineWriter
        {
            char *buffer;
            usize size;
            usize pos;

            void putChar(char c)
            {
                if (pos + 1 < size)
                {
                    buffer[pos++] = c;
                }
            }

            void putString(const char *str)
            {
                while (*str)
                {
                    putChar(*str++);
                }
            }

            void putNumber(u64 value, unsigned base, int minWidth, char padChar, bool uppercase)
            {
                static const char digitsLower[] = "0123456789abcdef";
                static const char digitsUpper[] = "0123456789ABCDEF";
                const char *digits = uppercase ? digitsUpper : digitsLower;

                char scratch[24];
                int count = 0;

                if (value == 0)
                {
                    scratch[count++] = '0';
                }
                else
                {
                    while (value > 0)
                    {
                        scratch[count++] = digits[value % base];
                        value /= base;
                    }
                }

                while (count < minWidth && count < static_cast<int>(sizeof(scratch)))
                {
                    scratch[count++] = padChar;
                }

                while (count > 0)
                {
                    putChar(scratch[--count]);
                }
            }

            void putSigned(i64 value, int minWidth, char padChar)
            {
                if (value < 0)
                {
                    putChar('-');
                    u64 magnitude = static_cast<u64>(-(value + 1)) + 1;
                    putNumber(magnitude, 10, minWidth > 0 ? minWidth - 1 : 0, padChar, false);
                }
                else
                {
                    putNumber(static_cast<u64>(value), 10, minWidth, padChar, false);
                }
            }

            void finish()
            {
                if (size == 0)
                    return;
                buffer[pos < size ? pos : size - 1] = '\0';
            }
        };

        void formatInto(LineWriter &out, const char *format, va_list args)
        {
            while (*format)
            {
                if (*format != '%')
                {
                    out.putChar(*format++);
                    continue;
                }

                format++; // Skip '%'

                if (*format == '%')
                {
                    out.putChar('%');
                    format++;
                    continue;
                }

                char padChar = ' ';
                int minWidth = 0;
                bool isLong = false;

                if (*format == '0')
                {
                    padChar = '0';
                    format++;
                }

                while (*format >= '0' && *format <= '9')
                {
                    minWidth = minWidth * 10 + (*format - '0');
                    format++;
                }

                // l, ll and z are all 64-bit on x86_64
                if (*format == 'l')
                {
                    isLong = true;
                    format++;
                    if (*format == 'l')
                        format++;
                }
                else if (*format == 'z')
                {
                    isLong = true;
                    format++;
                }

                switch (*format)
                {
                case 'd':
                case 'i':
                    if (isLong)
                        out.putSigned(va_arg(args, i64), minWidth, padChar);
                    else
                        out.putSigned(va_arg(args, int), minWidth, padChar);
                    break;

                case 'u':
                    if (isLong)
                        out.putNumber(va_arg(args, u64), 10, minWidth, padChar, false);
                    else
                        out.putNumber(va_arg(args, unsigned int), 10, minWidth, padChar, false);
                    break;

                case 'x':
                case 'X':
                    if (isLong)
                        out.putNumber(va_arg(args, u64), 16, minWidth, padChar, *format == 'X');
                    else
                        out.putNumber(va_arg(args, unsigned int), 16, minWidth, padChar, *format == 'X');
                    break;

                case 'p':
                    out.putString("0x");
                    out.putNumber(reinterpret_cast<uptr>(va_arg(args, void *)), 16, 16, '0', false);
                    break;

                case 's':
                {
                    const char *str = va_arg(args, const char *);
                    out.putString(str ? str : "(null)");
                    break;
                }

                case 'c':
                    out.putChar(static_cast<char>(va_arg(args, int)));
                    break;

                case '\0':
                    // Dangling '%' at end of format
                    out.putChar('%');
                    continue;

                default:
                    out.putChar('%');
                    out.putChar(*format);
                    break;
                }

                format++;
            }
        }
    }

    const char *logLevelName(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::Trace:
            return "[TRACE]";
        case LogLevel::Debug:
            return "[DEBUG]";
        case LogLevel::Info:
            return "[INFO ]";
        case LogLevel::Warning:
            return "[WARN ]";
        case LogLevel::Error:
            return "[ERROR]";
        case LogLevel::Fatal:
            return "[FATAL]";
        }
        return "[?????]";
    }

    Logger &Logger::instance()
    {
        static Logger instance;
        return instance;
    }

    Logger::Logger() : m_level(LogLevel::Info), m_output(nullptr)
    {
    }

    void Logger::setLevel(LogLevel level)
    {
        m_level = level;
    }

    void Logger::setOutput(LogOutputFn output)
    {
        m_output = output;
    }

    void Logger::emit(const char *line)
    {
        if (m_output)
        {
            m_output(line);
        }
    }

    usize Logger::vformat(char *buffer, usize size, const char *format, va_list args)
    {
        LineWriter out{buffer, size, 0};
        formatInto(out, format, args);
        out.finish();
        return out.pos;
    }

    usize Logger::format(char *buffer, usize size, const char *format, ...)
    {
        va_list args;
        va_start(args, format);
        usize written = vformat(buffer, size, format, args);
        va_end(args);
        return written;
    }

    void Logger::vlog(LogLevel level, const char *module, const char *format, va_list args)
    {
        if (level < m_level)
            return;

        char line[LINE_SIZE];
        LineWriter out{line, sizeof(line) - 1, 0};

        out.putString(logLevelName(level));
        out.putChar(' ');
        out.putString(module);
        out.putString(": ");
        formatInto(out, format, args);

        // Room for the newline was held back above
        line[out.pos++] = '\n';
        line[out.pos] = '\0';

        emit(line);
    }

    void Logger::log(LogLevel level, const char *module, const char *format, ...)
    {
        va_list args;
        va_start(args, format);
        vlog(level, module, format, args);
        va_end(args);
    }

    void Logger::print(const char *format, ...)
    {
        char line[LINE_SIZE];
        LineWriter out{line, sizeof(line) - 1, 0};

        va_list args;
        va_start(args, format);
        formatInto(out, format, args);
        va_end(args);

        line[out.pos++] = '\n';
        line[out.pos] = '\0';

        emit(line);
    }

} // namespace SC
