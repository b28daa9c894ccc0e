/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    Synthetic resource ids for split outputs.

    X resource ids only use the low 29 bits, so ids with all three top bits set
    can never come from the server. Below the reserved bits two bits give the
    object kind and the rest is a slot in a registry of (parent output, leaf
    index) pairs that only grows for the lifetime of the process. The same pair
    therefore maps to the same ids across config reloads.
*/

#ifndef SPLITRANDR_FAKE_XID_H
#define SPLITRANDR_FAKE_XID_H

#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace splitrandr
{

enum : uint32_t
{
    XID_RESERVED_MASK = 0xE0000000u,
    XID_KIND_SHIFT    = 27,
    XID_KIND_MASK     = 0x18000000u,
    XID_SLOT_MASK     = 0x07FFFFFFu
};

enum class XidClass
{
    Real,
    Fake
};

enum class FakeKind : uint32_t
{
    Output = 0,
    Crtc   = 1,
    Mode   = 2
};

inline bool is_fake(uint32_t xid)
{
    return (xid & XID_RESERVED_MASK) == XID_RESERVED_MASK;
}

inline XidClass classify(uint32_t xid)
{
    return is_fake(xid) ? XidClass::Fake : XidClass::Real;
}

inline uint32_t fake_slot(uint32_t xid)
{
    return xid & XID_SLOT_MASK;
}

inline FakeKind fake_kind(uint32_t xid)
{
    return FakeKind((xid & XID_KIND_MASK) >> XID_KIND_SHIFT);
}

inline uint32_t make_fake_xid(uint32_t slot, FakeKind kind)
{
    return XID_RESERVED_MASK | (uint32_t(kind) << XID_KIND_SHIFT) | (slot & XID_SLOT_MASK);
}

class FakeXidNamespace
{
public:
    explicit FakeXidNamespace(uint32_t capacity = XID_SLOT_MASK + 1);

    // Returns 0 when parentOutput is itself fake or the registry is full
    uint32_t allocate(uint32_t parentOutput, unsigned leafIndex, FakeKind kind = FakeKind::Output);

    // Slot of a previously allocated pair, or -1
    long findSlot(uint32_t parentOutput, unsigned leafIndex) const;

    size_t size() const { return slots.size(); }

private:
    struct Slot
    {
        uint32_t parentOutput;
        unsigned leafIndex;
    };
    std::vector<Slot> slots;
    uint32_t          capacity;
};

} // namespace splitrandr

#endif // SPLITRANDR_FAKE_XID_H
