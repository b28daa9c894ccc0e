/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include "dispatch.h"
#include "engine.h"
#include "log.h"

namespace
{

__attribute__((constructor)) void splitrandr_preload_init()
{
    using namespace splitrandr;

    Debug::init("splitrandr-preload");
    const bool xrandrOk = resolve_xrandr_dispatch();
    const bool xcbOk = resolve_xcb_randr_dispatch();
    if(!xrandrOk || !xcbOk)
        Debug::log(WARN, "some real RandR functions are missing, calls to them will fail");
    install_error_filter();
    Engine::instance().attach();
}

} // namespace
