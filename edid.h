/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#ifndef SPLITRANDR_EDID_H
#define SPLITRANDR_EDID_H

#include <stddef.h>
#include <stdint.h>
#include <string>

namespace splitrandr
{

// Lower-case hex, two characters per byte, capped at the config field width
std::string edid_to_hex(const uint8_t* edid, size_t size);

struct MonitorIdentity
{
    std::string vendor = "unknown";
    std::string product = "unknown";
    std::string serial = "unknown";
};

// Manufacturer id and the name/serial text descriptors of a hex EDID
MonitorIdentity parse_monitor_identity(std::string const& edidHex);

} // namespace splitrandr

#endif // SPLITRANDR_EDID_H
