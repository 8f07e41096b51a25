#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstddef>
#include <algorithm>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace tpuproxy
{

/**
 * Owns the bytes of outgoing streams for as long as the QUIC stack may need
 * them.
 *
 * The stack does not copy stream data: a slice handed to it is referenced
 * until the peer acknowledges it, and may be read again for retransmission
 * long after the application considers the stream written. Each stream's
 * bytes therefore live here until every byte has been acknowledged or the
 * stream has been closed, independently of when its writer was told the
 * stream went out.
 */
class StreamSendBuffer
{
    struct Entry
    {
        std::vector<uint8_t> mBytes;
        size_t mSent{0};
        uint64_t mAcked{0};
    };

    std::map<int64_t, Entry> mEntries;

  public:
    void add(int64_t streamID, std::vector<uint8_t> bytes);

    // The part of the stream not yet handed to the stack; {nullptr, 0} for
    // an unknown stream.
    std::pair<uint8_t const*, size_t> unsent(int64_t streamID) const;

    // Records `n` more bytes taken by the stack. Returns true once the whole
    // stream has been taken.
    bool markSent(int64_t streamID, size_t n);

    // Records `n` more bytes acknowledged by the peer and releases the
    // stream once all of it has been.
    void markAcked(int64_t streamID, uint64_t n);

    void release(int64_t streamID);

    bool contains(int64_t streamID) const;
    size_t size() const;
    size_t retainedBytes() const;
};
}
