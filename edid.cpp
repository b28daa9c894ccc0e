/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <algorithm>
#include <vector>

#include "config-codec.h"
#include "edid.h"

namespace splitrandr
{

namespace
{

int hex_value(char c)
{
    if(c >= '0' && c <= '9')
        return c - '0';
    if(c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if(c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool hex_to_bytes(std::string const& hex, std::vector<uint8_t>& bytes)
{
    bytes.clear();
    for(size_t i = 0; i + 1 < hex.size(); i += 2)
    {
        const int hi = hex_value(hex[i]);
        const int lo = hex_value(hex[i + 1]);
        if(hi < 0 || lo < 0)
            return false;
        bytes.push_back(hi << 4 | lo);
    }
    return true;
}

std::string descriptor_text(const uint8_t* text)
{
    std::string out;
    for(int i = 0; i < 13 && text[i] != 0x0a; ++i)
        out += text[i] >= 0x20 && text[i] < 0x7f ? char(text[i]) : '?';
    const auto first = out.find_first_not_of(' ');
    const auto last = out.find_last_not_of(' ');
    if(first == std::string::npos)
        return std::string();
    return out.substr(first, last - first + 1);
}

} // namespace

std::string edid_to_hex(const uint8_t* edid, size_t size)
{
    static const char digits[] = "0123456789abcdef";
    size = std::min<size_t>(size, CONFIG_EDID_SIZE / 2);
    std::string hex;
    hex.reserve(size * 2);
    for(size_t i = 0; i < size; ++i)
    {
        hex += digits[(edid[i] >> 4) & 0xf];
        hex += digits[edid[i] & 0xf];
    }
    return hex;
}

MonitorIdentity parse_monitor_identity(std::string const& edidHex)
{
    MonitorIdentity identity;
    std::vector<uint8_t> edid;
    if(edidHex.size() < 256 || !hex_to_bytes(edidHex, edid))
        return identity;

    // Bytes 8-9: three 5-bit letters, 'A' == 1
    const unsigned vendor = edid[8] << 8 | edid[9];
    identity.vendor.clear();
    for(int shift = 10; shift >= 0; shift -= 5)
        identity.vendor += char('A' - 1 + ((vendor >> shift) & 0x1f));

    // Four 18-byte display descriptors from byte 54
    for(int i = 0; i < 4; ++i)
    {
        const uint8_t* const desc = &edid[54 + i * 18];
        if(desc[0] || desc[1] || desc[2])
            continue;
        const auto text = descriptor_text(desc + 5);
        if(text.empty())
            continue;
        if(desc[3] == 0xfc)
            identity.product = text;
        else if(desc[3] == 0xff)
            identity.serial = text;
    }
    return identity;
}

} // namespace splitrandr
