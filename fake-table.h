/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    Fake outputs, CRTCs and modes synthesized for every leaf of every split
    output. The table is built from the decoded configuration and a snapshot
    of the real RandR state, and kept independent of the X client libraries
    so both hook sets can share it.
*/

#ifndef SPLITRANDR_FAKE_TABLE_H
#define SPLITRANDR_FAKE_TABLE_H

#include <stdint.h>
#include <string>
#include <vector>

#include "config-codec.h"
#include "fake-xid.h"

namespace splitrandr
{

struct ModeTiming
{
    unsigned long dotClock = 0;
    unsigned      hSyncStart = 0;
    unsigned      hSyncEnd = 0;
    unsigned      hTotal = 0;
    unsigned      hSkew = 0;
    unsigned      vSyncStart = 0;
    unsigned      vSyncEnd = 0;
    unsigned      vTotal = 0;
    unsigned long modeFlags = 0;
};

// What the engine needs to know about one real output to split it
struct RealOutputState
{
    uint32_t      output = 0;
    std::string   name;
    std::string   edidHex;
    uint32_t      crtc = 0;
    int           crtcX = 0;
    int           crtcY = 0;
    unsigned      crtcWidth = 0;
    unsigned      crtcHeight = 0;
    uint32_t      mode = 0;
    uint16_t      rotation = 1;
    uint16_t      rotations = 1;
    unsigned long mmWidth = 0;
    unsigned long mmHeight = 0;
    uint8_t       subpixelOrder = 0;
    ModeTiming    timing;
};

struct FakeOutputRecord
{
    uint32_t      xid;
    uint32_t      parentOutput;
    uint32_t      crtc;
    uint32_t      mode;
    unsigned      leafIndex;
    std::string   name;
    unsigned long mmWidth;
    unsigned long mmHeight;
    uint8_t       subpixelOrder;
};

struct FakeCrtcRecord
{
    uint32_t xid;
    uint32_t output;
    uint32_t parentCrtc;
    int      x;
    int      y;
    unsigned width;
    unsigned height;
    uint32_t mode;
    uint16_t rotation;
    uint16_t rotations;
};

struct FakeModeRecord
{
    uint32_t    xid;
    unsigned    width;
    unsigned    height;
    ModeTiming  timing;
    std::string name;
};

struct FakeLookup
{
    enum Kind
    {
        NotFound,
        Output,
        Crtc,
        Mode
    };
    Kind                    kind = NotFound;
    const FakeOutputRecord* output = nullptr;
    const FakeCrtcRecord*   crtc = nullptr;
    const FakeModeRecord*   mode = nullptr;
};

class FakeTable
{
public:
    std::vector<FakeOutputRecord> outputs;
    std::vector<FakeCrtcRecord>   crtcs;
    std::vector<FakeModeRecord>   modes;

    FakeLookup lookup(uint32_t xid) const;
    const FakeOutputRecord* findOutput(uint32_t xid) const;
    const FakeCrtcRecord* findCrtc(uint32_t xid) const;
    const FakeModeRecord* findMode(uint32_t xid) const;

    // Real outputs and CRTCs replaced by fake ones
    bool isSplitOutput(uint32_t realOutput) const;
    bool isSplitCrtc(uint32_t realCrtc) const;

    // In-memory only; the real CRTC is never touched
    bool updateCrtc(uint32_t xid, int x, int y, uint32_t mode, uint16_t rotation);

    bool empty() const { return outputs.empty(); }
};

enum class BuildStatus
{
    Ok,
    // The id registry is exhausted or returned a duplicate; the engine must stop faking
    IdCollision
};

/*
    Matches every real output against the configuration (by EDID when the
    entry carries one, by name otherwise) and creates one output/CRTC/mode
    triple per leaf. Outputs whose current CRTC size differs from the
    configured size are left alone.
*/
BuildStatus build_fake_table(std::vector<DecodedEntry> const& config, std::vector<RealOutputState> const& real,
                             FakeXidNamespace& ids, FakeTable& table);

} // namespace splitrandr

#endif // SPLITRANDR_FAKE_TABLE_H
