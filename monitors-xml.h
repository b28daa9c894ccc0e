/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    The desktop session's display persistence file (cinnamon-monitors.xml,
    version 2). The window manager re-applies it on startup, so it must
    describe the split layout or it would undo the virtual monitors.
*/

#ifndef SPLITRANDR_MONITORS_XML_H
#define SPLITRANDR_MONITORS_XML_H

#include <string>

#include "display-layout.h"

namespace splitrandr
{

/*
    Two configurations: the split layout, with one logical monitor per leaf
    of every split output (connector <output>~<n>, unknown vendor, product
    and serial), followed by the same layout without splits. Inactive outputs
    are omitted.
*/
std::string monitors_xml(DisplayLayout const& layout);

bool write_monitors_xml(std::string const& path, DisplayLayout const& layout);

} // namespace splitrandr

#endif // SPLITRANDR_MONITORS_XML_H
