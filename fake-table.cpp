/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <stdio.h>
#include <set>

#include "fake-table.h"
#include "log.h"

namespace splitrandr
{

namespace
{

template<typename T>
T* find_xid(std::vector<T>& list, uint32_t xid)
{
    for(auto& item : list)
        if(item.xid == xid)
            return &item;
    return nullptr;
}

template<typename T>
const T* find_xid(std::vector<T> const& list, uint32_t xid)
{
    for(const auto& item : list)
        if(item.xid == xid)
            return &item;
    return nullptr;
}

const DecodedEntry* match_entry(std::vector<DecodedEntry> const& config, RealOutputState const& output)
{
    for(const auto& entry : config)
    {
        if(!entry.config.edidHex.empty())
        {
            if(entry.config.edidHex == output.edidHex)
                return &entry;
        }
        else if(entry.config.name == output.name)
            return &entry;
    }
    return nullptr;
}

std::string mode_name(unsigned width, unsigned height)
{
    char name[32];
    snprintf(name, sizeof name, "%ux%u", width, height);
    return name;
}

} // namespace

FakeLookup FakeTable::lookup(uint32_t xid) const
{
    FakeLookup result;
    if(!is_fake(xid))
        return result;
    switch(fake_kind(xid))
    {
    case FakeKind::Output:
        if((result.output = findOutput(xid)))
            result.kind = FakeLookup::Output;
        break;
    case FakeKind::Crtc:
        if((result.crtc = findCrtc(xid)))
            result.kind = FakeLookup::Crtc;
        break;
    case FakeKind::Mode:
        if((result.mode = findMode(xid)))
            result.kind = FakeLookup::Mode;
        break;
    }
    return result;
}

const FakeOutputRecord* FakeTable::findOutput(uint32_t xid) const
{
    return find_xid(outputs, xid);
}

const FakeCrtcRecord* FakeTable::findCrtc(uint32_t xid) const
{
    return find_xid(crtcs, xid);
}

const FakeModeRecord* FakeTable::findMode(uint32_t xid) const
{
    return find_xid(modes, xid);
}

bool FakeTable::isSplitOutput(uint32_t realOutput) const
{
    for(const auto& output : outputs)
        if(output.parentOutput == realOutput)
            return true;
    return false;
}

bool FakeTable::isSplitCrtc(uint32_t realCrtc) const
{
    for(const auto& crtc : crtcs)
        if(crtc.parentCrtc == realCrtc)
            return true;
    return false;
}

bool FakeTable::updateCrtc(uint32_t xid, int x, int y, uint32_t mode, uint16_t rotation)
{
    auto*const crtc = find_xid(crtcs, xid);
    if(!crtc)
        return false;
    crtc->x = x;
    crtc->y = y;
    crtc->rotation = rotation;
    if(mode == 0)
    {
        // Disabling a fake CRTC keeps its geometry so a later enable can restore it
        crtc->mode = 0;
        return true;
    }
    if(const auto*const fakeMode = findMode(mode))
    {
        crtc->width = fakeMode->width;
        crtc->height = fakeMode->height;
    }
    crtc->mode = mode;
    return true;
}

BuildStatus build_fake_table(std::vector<DecodedEntry> const& config, std::vector<RealOutputState> const& real,
                             FakeXidNamespace& ids, FakeTable& table)
{
    FakeTable result;
    std::set<uint32_t> used;

    for(const auto& output : real)
    {
        if(!output.crtc)
            continue;
        const auto*const entry = match_entry(config, output);
        if(!entry || entry->leaves.size() < 2)
            continue;
        if(output.crtcWidth != entry->config.width || output.crtcHeight != entry->config.height)
        {
            Debug::log(WARN, "%s is %ux%u but the split was made for %ux%u, leaving it unsplit", output.name.c_str(),
                       output.crtcWidth, output.crtcHeight, entry->config.width, entry->config.height);
            continue;
        }

        for(unsigned n = 0; n < entry->leaves.size(); ++n)
        {
            const auto& leaf = entry->leaves[n];
            const auto outputXid = ids.allocate(output.output, n, FakeKind::Output);
            const auto crtcXid = ids.allocate(output.output, n, FakeKind::Crtc);
            const auto modeXid = ids.allocate(output.output, n, FakeKind::Mode);
            if(!outputXid || !crtcXid || !modeXid)
                return BuildStatus::IdCollision;
            if(!used.insert(outputXid).second || !used.insert(crtcXid).second || !used.insert(modeXid).second)
                return BuildStatus::IdCollision;

            FakeOutputRecord fakeOutput;
            fakeOutput.xid = outputXid;
            fakeOutput.parentOutput = output.output;
            fakeOutput.crtc = crtcXid;
            fakeOutput.mode = modeXid;
            fakeOutput.leafIndex = n;
            fakeOutput.name = output.name + "~" + std::to_string(n);
            fakeOutput.mmWidth = output.crtcWidth ? output.mmWidth * leaf.width / output.crtcWidth : 0;
            fakeOutput.mmHeight = output.crtcHeight ? output.mmHeight * leaf.height / output.crtcHeight : 0;
            fakeOutput.subpixelOrder = output.subpixelOrder;
            result.outputs.push_back(fakeOutput);

            FakeCrtcRecord fakeCrtc;
            fakeCrtc.xid = crtcXid;
            fakeCrtc.output = outputXid;
            fakeCrtc.parentCrtc = output.crtc;
            fakeCrtc.x = output.crtcX + leaf.x;
            fakeCrtc.y = output.crtcY + leaf.y;
            fakeCrtc.width = leaf.width;
            fakeCrtc.height = leaf.height;
            fakeCrtc.mode = modeXid;
            fakeCrtc.rotation = output.rotation;
            fakeCrtc.rotations = output.rotations;
            result.crtcs.push_back(fakeCrtc);

            FakeModeRecord fakeMode;
            fakeMode.xid = modeXid;
            fakeMode.width = leaf.width;
            fakeMode.height = leaf.height;
            fakeMode.timing = output.timing;
            fakeMode.name = mode_name(leaf.width, leaf.height);
            result.modes.push_back(fakeMode);

            Debug::log(TRACE, "fake output %s (0x%08x) crtc 0x%08x at %d,%d %ux%u", fakeOutput.name.c_str(), outputXid,
                       crtcXid, fakeCrtc.x, fakeCrtc.y, leaf.width, leaf.height);
        }
    }

    table = std::move(result);
    return BuildStatus::Ok;
}

} // namespace splitrandr
