/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    Binary configuration shared between the command-line tool and the preload
    library. One entry per split output, concatenated until end of file:

        Entry := length:u32 name:char[128] edid:char[768]
                 width:u32 height:u32 leaf_count:u32 tree:Node
        Node  := 'N' | 'H' pos:u32 Node Node | 'V' pos:u32 Node Node

    length counts the bytes after the length field. pos is the pixel offset of
    the cut inside the node's rectangle (from the top for H, from the left for
    V). Integers are little-endian, strings zero padded.
*/

#ifndef SPLITRANDR_CONFIG_CODEC_H
#define SPLITRANDR_CONFIG_CODEC_H

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "split-tree.h"

namespace splitrandr
{

enum
{
    CONFIG_NAME_SIZE = 128,
    CONFIG_EDID_SIZE = 768,
    CONFIG_HEADER_SIZE = CONFIG_NAME_SIZE + CONFIG_EDID_SIZE + 3 * 4
};

struct OutputSplitConfig
{
    std::string name;
    std::string edidHex;
    unsigned    width = 0;
    unsigned    height = 0;
    SplitTree   tree;

    bool operator==(OutputSplitConfig const& other) const
    {
        return name == other.name && edidHex == other.edidHex && width == other.width &&
               height == other.height && tree == other.tree;
    }
    bool operator!=(OutputSplitConfig const& other) const { return !(*this == other); }
};

struct DecodedEntry
{
    OutputSplitConfig config;
    // Leaf rectangles accumulated from the embedded cut offsets
    std::vector<Rect> leaves;
    // A cut fell outside its rectangle or produced an empty leaf; config.tree
    // was replaced by a single leaf
    bool geometryFallback = false;
};

enum class DecodeStatus
{
    Ok,
    Truncated,
    LengthMismatch,
    BadTag,
    LeafCountMismatch,
    TooDeep
};

const char* decode_status_name(DecodeStatus status);

void encode_entry(OutputSplitConfig const& config, std::vector<uint8_t>& out);
std::vector<uint8_t> encode_config(std::vector<OutputSplitConfig> const& configs);

/*
    Decodes a whole stream. Any malformed entry fails the whole stream so the
    caller can keep its previous state; out is only written on success.
    failedEntry receives the index of the offending entry when not null.
*/
DecodeStatus decode_config(const uint8_t* data, size_t size, std::vector<DecodedEntry>& out,
                           size_t* failedEntry = nullptr);

} // namespace splitrandr

#endif // SPLITRANDR_CONFIG_CODEC_H
