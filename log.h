/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    Leveled logging shared by the preload library and the command-line tool.
*/

#ifndef SPLITRANDR_LOG_H
#define SPLITRANDR_LOG_H

namespace splitrandr
{

enum LogLevel
{
    NONE = -1,
    LOG  = 0,
    WARN,
    ERR,
    TRACE
};

namespace Debug
{
    // Reads SPLITRANDR_DEBUG and SPLITRANDR_QUIET. The tag prefixes every line.
    void init(const char* tag);

    void setTrace(bool enabled);

    void log(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
}

} // namespace splitrandr

#endif // SPLITRANDR_LOG_H
