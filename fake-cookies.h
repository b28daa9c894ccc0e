/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    Pending replies to requests that were answered locally instead of being
    sent to the server. The caller holds a cookie whose sequence number
    belongs to a harmless core request; the reply hook looks it up here to
    substitute the remembered status.
*/

#ifndef SPLITRANDR_FAKE_COOKIES_H
#define SPLITRANDR_FAKE_COOKIES_H

#include <stddef.h>
#include <stdint.h>
#include <map>
#include <mutex>

namespace splitrandr
{

class FakeReplyCookies
{
public:
    // Per connection; cookies dropped without fetching the reply are evicted oldest first
    explicit FakeReplyCookies(size_t limit = 64);

    void remember(const void* connection, unsigned sequence, uint8_t status);

    // Removes the entry and returns its status; false if the sequence is not a fake one
    bool take(const void* connection, unsigned sequence, uint8_t& status);

    size_t pending(const void* connection) const;

private:
    mutable std::mutex                                 lock_;
    std::map<const void*, std::map<unsigned, uint8_t>> pending_;
    size_t                                             limit_;
};

} // namespace splitrandr

#endif // SPLITRANDR_FAKE_COOKIES_H
