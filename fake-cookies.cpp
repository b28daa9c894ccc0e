/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include "fake-cookies.h"
#include "log.h"

namespace splitrandr
{

FakeReplyCookies::FakeReplyCookies(size_t limit)
    : limit_(limit ? limit : 1)
{
}

void FakeReplyCookies::remember(const void* connection, unsigned sequence, uint8_t status)
{
    std::lock_guard<std::mutex> guard(lock_);
    auto& cookies = pending_[connection];
    cookies[sequence] = status;
    while(cookies.size() > limit_)
    {
        Debug::log(TRACE, "dropping unclaimed fake reply for sequence %u", cookies.begin()->first);
        cookies.erase(cookies.begin());
    }
}

bool FakeReplyCookies::take(const void* connection, unsigned sequence, uint8_t& status)
{
    std::lock_guard<std::mutex> guard(lock_);
    const auto conn = pending_.find(connection);
    if(conn == pending_.end())
        return false;
    const auto cookie = conn->second.find(sequence);
    if(cookie == conn->second.end())
        return false;
    status = cookie->second;
    conn->second.erase(cookie);
    if(conn->second.empty())
        pending_.erase(conn);
    return true;
}

size_t FakeReplyCookies::pending(const void* connection) const
{
    std::lock_guard<std::mutex> guard(lock_);
    const auto conn = pending_.find(connection);
    return conn == pending_.end() ? 0 : conn->second.size();
}

} // namespace splitrandr
