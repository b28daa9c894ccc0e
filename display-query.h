/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#ifndef SPLITRANDR_DISPLAY_QUERY_H
#define SPLITRANDR_DISPLAY_QUERY_H

#include <xcb/xcb.h>
#include <xcb/randr.h>

#include "display-layout.h"

namespace splitrandr
{

/*
    Reads the current real topology of the screen: every connected output
    with its EDID, CRTC geometry, mode, rotation and primary flag. Split trees
    are left as single leaves. Returns false if the server does not answer
    the RandR requests.
*/
bool query_display_layout(xcb_connection_t* c, xcb_screen_t* screen, DisplayLayout& layout);

/*
    Reads the existing <output>~<n> virtual monitors back into split trees of
    the outputs they belong to. Outputs without virtual monitors keep their
    tree.
*/
bool query_split_trees(xcb_connection_t* c, xcb_screen_t* screen, DisplayLayout& layout);

// Refresh rate of a mode in Hz, 0 if the timings are incomplete
double mode_refresh_rate(xcb_randr_mode_info_t const& mode);

} // namespace splitrandr

#endif // SPLITRANDR_DISPLAY_QUERY_H
