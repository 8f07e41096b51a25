// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transport/StreamSendBuffer.h"

namespace tpuproxy
{

void
StreamSendBuffer::add(int64_t streamID, std::vector<uint8_t> bytes)
{
    auto& e = mEntries[streamID];
    e.mBytes = std::move(bytes);
    e.mSent = 0;
    e.mAcked = 0;
}

std::pair<uint8_t const*, size_t>
StreamSendBuffer::unsent(int64_t streamID) const
{
    auto it = mEntries.find(streamID);
    if (it == mEntries.end())
    {
        return {nullptr, 0};
    }
    auto const& e = it->second;
    return {e.mBytes.data() + e.mSent, e.mBytes.size() - e.mSent};
}

bool
StreamSendBuffer::markSent(int64_t streamID, size_t n)
{
    auto it = mEntries.find(streamID);
    if (it == mEntries.end())
    {
        return false;
    }
    auto& e = it->second;
    e.mSent = std::min(e.mBytes.size(), e.mSent + n);
    return e.mSent == e.mBytes.size();
}

void
StreamSendBuffer::markAcked(int64_t streamID, uint64_t n)
{
    auto it = mEntries.find(streamID);
    if (it == mEntries.end())
    {
        return;
    }
    it->second.mAcked += n;
    if (it->second.mAcked >= it->second.mBytes.size())
    {
        mEntries.erase(it);
    }
}

void
StreamSendBuffer::release(int64_t streamID)
{
    mEntries.erase(streamID);
}

bool
StreamSendBuffer::contains(int64_t streamID) const
{
    return mEntries.find(streamID) != mEntries.end();
}

size_t
StreamSendBuffer::size() const
{
    return mEntries.size();
}

size_t
StreamSendBuffer::retainedBytes() const
{
    size_t total = 0;
    for (auto const& kv : mEntries)
    {
        total += kv.second.mBytes.size();
    }
    return total;
}
}
