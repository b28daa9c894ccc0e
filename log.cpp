/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <string.h>

#include "log.h"

namespace splitrandr
{

namespace
{

const char* logTag = "splitrandr";
bool        traceOn = false;
bool        quietOn = false;

bool envFlag(const char* name)
{
    const char* value = getenv(name);
    return value && *value && strcmp(value, "0") != 0;
}

const char* levelName(LogLevel level)
{
    switch(level)
    {
    case WARN:  return "WARN";
    case ERR:   return "ERR";
    case TRACE: return "TRACE";
    default:    return "LOG";
    }
}

} // namespace

void Debug::init(const char* tag)
{
    if(tag)
        logTag = tag;
    traceOn = envFlag("SPLITRANDR_DEBUG");
    quietOn = envFlag("SPLITRANDR_QUIET");
}

void Debug::setTrace(bool enabled)
{
    traceOn = enabled;
}

void Debug::log(LogLevel level, const char* fmt, ...)
{
    if(level == NONE)
        return;
    if(level == TRACE && !traceOn)
        return;
    if(level == LOG && quietOn)
        return;

    // One write per line so lines from the host process are not interleaved mid-message
    char line[1024];
    int  len = snprintf(line, sizeof line, "[%s] %s: ", logTag, levelName(level));
    if(len < 0)
        return;

    va_list args;
    va_start(args, fmt);
    const int body = vsnprintf(line + len, sizeof line - len, fmt, args);
    va_end(args);
    if(body < 0)
        return;

    len = strlen(line);
    if(len == sizeof line - 1)
        line[len - 1] = '\n';
    else
    {
        line[len++] = '\n';
        line[len] = 0;
    }
    fputs(line, stderr);
}

} // namespace splitrandr
