/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <string.h>
#include <algorithm>

#include "config-codec.h"

namespace splitrandr
{

namespace
{

const unsigned MAX_TREE_DEPTH = 64;

void put_u32(std::vector<uint8_t>& out, uint32_t value)
{
    out.push_back(value & 0xff);
    out.push_back((value >> 8) & 0xff);
    out.push_back((value >> 16) & 0xff);
    out.push_back((value >> 24) & 0xff);
}

void put_fixed(std::vector<uint8_t>& out, std::string const& value, size_t width)
{
    const auto len = std::min(value.size(), width);
    out.insert(out.end(), value.begin(), value.begin() + len);
    out.insert(out.end(), width - len, 0);
}

void encode_node(SplitNode const& node, unsigned width, unsigned height, std::vector<uint8_t>& out)
{
    if(node.leaf)
    {
        out.push_back('N');
        return;
    }
    if(node.direction == SplitDirection::Horizontal)
    {
        const auto pos = cut_position(node, height);
        out.push_back('H');
        put_u32(out, pos);
        encode_node(*node.before, width, pos, out);
        encode_node(*node.after, width, height - pos, out);
    }
    else
    {
        const auto pos = cut_position(node, width);
        out.push_back('V');
        put_u32(out, pos);
        encode_node(*node.before, pos, height, out);
        encode_node(*node.after, width - pos, height, out);
    }
}

class Reader
{
public:
    Reader(const uint8_t* data, size_t size)
        : data(data), size(size)
    {
    }
    bool u32(uint32_t& value)
    {
        if(size - offset < 4)
            return false;
        const auto p = data + offset;
        value = uint32_t(p[0]) | uint32_t(p[1]) << 8 | uint32_t(p[2]) << 16 | uint32_t(p[3]) << 24;
        offset += 4;
        return true;
    }
    bool byte(uint8_t& value)
    {
        if(offset >= size)
            return false;
        value = data[offset++];
        return true;
    }
    bool fixed(std::string& value, size_t width)
    {
        if(size - offset < width)
            return false;
        const auto p = reinterpret_cast<const char*>(data + offset);
        value.assign(p, strnlen(p, width));
        offset += width;
        return true;
    }
    size_t position() const { return offset; }
    size_t remaining() const { return size - offset; }

private:
    const uint8_t* data;
    size_t         size;
    size_t         offset = 0;
};

struct NodeWalk
{
    Reader&            in;
    std::vector<Rect>& leaves;
    unsigned           leafCount = 0;
    bool               geometryBad = false;

    NodeWalk(Reader& in, std::vector<Rect>& leaves)
        : in(in), leaves(leaves)
    {
    }

    // Reads one node laid over (x, y, width, height). The decoded proportion
    // is the cut offset relative to the node extent.
    DecodeStatus read(SplitNode& node, int x, int y, unsigned width, unsigned height, unsigned depth)
    {
        if(depth > MAX_TREE_DEPTH)
            return DecodeStatus::TooDeep;

        uint8_t tag;
        if(!in.byte(tag))
            return DecodeStatus::Truncated;
        if(tag == 'N')
        {
            node.leaf = true;
            ++leafCount;
            if(width == 0 || height == 0)
                geometryBad = true;
            leaves.push_back(Rect(x, y, width, height));
            return DecodeStatus::Ok;
        }
        if(tag != 'H' && tag != 'V')
            return DecodeStatus::BadTag;

        uint32_t pos;
        if(!in.u32(pos))
            return DecodeStatus::Truncated;

        node.leaf = false;
        node.direction = tag == 'H' ? SplitDirection::Horizontal : SplitDirection::Vertical;
        node.before.reset(new SplitNode);
        node.after.reset(new SplitNode);

        const unsigned extent = tag == 'H' ? height : width;
        if(pos == 0 || pos >= extent)
        {
            geometryBad = true;
            pos = std::min<uint32_t>(pos, extent);
        }
        node.proportion = extent ? double(pos) / extent : 0.5;

        DecodeStatus status;
        if(tag == 'H')
        {
            status = read(*node.before, x, y, width, pos, depth + 1);
            if(status != DecodeStatus::Ok)
                return status;
            return read(*node.after, x, y + pos, width, height - pos, depth + 1);
        }
        status = read(*node.before, x, y, pos, height, depth + 1);
        if(status != DecodeStatus::Ok)
            return status;
        return read(*node.after, x + pos, y, width - pos, height, depth + 1);
    }
};

SplitTree tree_from_node(SplitNode const& node)
{
    if(node.leaf)
        return SplitTree();
    return SplitTree::makeSplit(node.direction, node.proportion, tree_from_node(*node.before), tree_from_node(*node.after));
}

DecodeStatus decode_entry(Reader& in, DecodedEntry& entry)
{
    uint32_t length;
    if(!in.u32(length))
        return DecodeStatus::Truncated;
    if(length > in.remaining())
        return DecodeStatus::Truncated;
    const auto start = in.position();

    uint32_t width, height, leafCount;
    auto& config = entry.config;
    if(!in.fixed(config.name, CONFIG_NAME_SIZE) || !in.fixed(config.edidHex, CONFIG_EDID_SIZE) ||
       !in.u32(width) || !in.u32(height) || !in.u32(leafCount))
        return DecodeStatus::Truncated;
    config.width = width;
    config.height = height;

    SplitNode root;
    NodeWalk walk(in, entry.leaves);
    const auto status = walk.read(root, 0, 0, width, height, 0);
    if(status != DecodeStatus::Ok)
        return status;
    if(in.position() - start != length)
        return DecodeStatus::LengthMismatch;
    if(walk.leafCount != leafCount)
        return DecodeStatus::LeafCountMismatch;

    if(walk.geometryBad)
    {
        entry.geometryFallback = true;
        config.tree = SplitTree();
        entry.leaves.assign(1, Rect(0, 0, width, height));
        return DecodeStatus::Ok;
    }

    config.tree = tree_from_node(root);
    return DecodeStatus::Ok;
}

} // namespace

const char* decode_status_name(DecodeStatus status)
{
    switch(status)
    {
    case DecodeStatus::Ok:                return "ok";
    case DecodeStatus::Truncated:         return "truncated entry";
    case DecodeStatus::LengthMismatch:    return "declared length does not match entry size";
    case DecodeStatus::BadTag:            return "invalid node tag";
    case DecodeStatus::LeafCountMismatch: return "leaf count does not match tree";
    case DecodeStatus::TooDeep:           return "split tree nested too deeply";
    }
    return "unknown";
}

void encode_entry(OutputSplitConfig const& config, std::vector<uint8_t>& out)
{
    std::vector<uint8_t> payload;
    payload.reserve(CONFIG_HEADER_SIZE + 5 * config.tree.leafCount());
    put_fixed(payload, config.name, CONFIG_NAME_SIZE);
    put_fixed(payload, config.edidHex, CONFIG_EDID_SIZE);
    put_u32(payload, config.width);
    put_u32(payload, config.height);
    put_u32(payload, config.tree.leafCount());
    encode_node(config.tree.root(), config.width, config.height, payload);

    put_u32(out, payload.size());
    out.insert(out.end(), payload.begin(), payload.end());
}

std::vector<uint8_t> encode_config(std::vector<OutputSplitConfig> const& configs)
{
    std::vector<uint8_t> out;
    for(const auto& config : configs)
        encode_entry(config, out);
    return out;
}

DecodeStatus decode_config(const uint8_t* data, size_t size, std::vector<DecodedEntry>& out, size_t* failedEntry)
{
    std::vector<DecodedEntry> entries;
    Reader in(data, size);
    while(in.remaining() > 0)
    {
        entries.push_back(DecodedEntry());
        const auto status = decode_entry(in, entries.back());
        if(status != DecodeStatus::Ok)
        {
            if(failedEntry)
                *failedEntry = entries.size() - 1;
            return status;
        }
    }
    out.swap(entries);
    return DecodeStatus::Ok;
}

} // namespace splitrandr
