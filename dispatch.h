/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    Every intercepted symbol has one slot in a dispatch table holding the next
    definition in the lookup order, i.e. the real library function. Symbols
    that are not intercepted never reach this library.
*/

#ifndef SPLITRANDR_DISPATCH_H
#define SPLITRANDR_DISPATCH_H

#include <dlfcn.h>
#include <string.h>

#include "log.h"

#define SPLITRANDR_DECLARE_REAL(fn) decltype(&::fn) fn = nullptr;
#define SPLITRANDR_RESOLVE_REAL(fn) ok = splitrandr::resolve_next(table.fn, #fn) && ok;

namespace splitrandr
{

template<typename Fn>
bool resolve_next(Fn& fn, const char* name)
{
    void* const symbol = dlsym(RTLD_NEXT, name);
    if(!symbol)
    {
        Debug::log(ERR, "cannot find the real %s: %s", name, dlerror());
        return false;
    }
    static_assert(sizeof fn == sizeof symbol, "function and data pointers differ in size");
    memcpy(&fn, &symbol, sizeof fn);
    return true;
}

// Defined by the hook sets, called from the library constructor
bool resolve_xrandr_dispatch();
bool resolve_xcb_randr_dispatch();
void install_error_filter();

} // namespace splitrandr

#endif // SPLITRANDR_DISPATCH_H
