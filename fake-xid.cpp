/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include "fake-xid.h"

namespace splitrandr
{

FakeXidNamespace::FakeXidNamespace(uint32_t capacity)
    : capacity(capacity)
{
}

long FakeXidNamespace::findSlot(uint32_t parentOutput, unsigned leafIndex) const
{
    for(size_t i = 0; i < slots.size(); ++i)
    {
        if(slots[i].parentOutput == parentOutput && slots[i].leafIndex == leafIndex)
            return i;
    }
    return -1;
}

uint32_t FakeXidNamespace::allocate(uint32_t parentOutput, unsigned leafIndex, FakeKind kind)
{
    if(is_fake(parentOutput))
        return 0;

    long slot = findSlot(parentOutput, leafIndex);
    if(slot < 0)
    {
        if(slots.size() >= capacity)
            return 0;
        slots.push_back(Slot{parentOutput, leafIndex});
        slot = slots.size() - 1;
    }
    return make_fake_xid(slot, kind);
}

} // namespace splitrandr
