#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <array>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace tpuproxy
{

/**
 * Non-owning view over contiguous bytes, used to hand key material, payloads
 * and DER blobs to the crypto and encoding functions. The referenced storage
 * must outlive the slice.
 */
class ByteSlice
{
    uint8_t const* mBytes;
    size_t mLength;

  public:
    ByteSlice(void const* data, size_t size)
        : mBytes(static_cast<uint8_t const*>(data)), mLength(size)
    {
    }
    ByteSlice(std::vector<uint8_t> const& v) : ByteSlice(v.data(), v.size())
    {
    }
    ByteSlice(std::string const& s) : ByteSlice(s.data(), s.size())
    {
    }
    ByteSlice(char const* str) : ByteSlice(str, std::strlen(str))
    {
    }
    template <size_t N>
    ByteSlice(std::array<uint8_t, N> const& a) : ByteSlice(a.data(), N)
    {
    }

    uint8_t const*
    data() const
    {
        return mBytes;
    }
    size_t
    size() const
    {
        return mLength;
    }
    bool
    empty() const
    {
        return mLength == 0;
    }
    uint8_t const*
    begin() const
    {
        return mBytes;
    }
    uint8_t const*
    end() const
    {
        return mBytes + mLength;
    }

    uint8_t
    operator[](size_t i) const
    {
        if (i >= mLength)
        {
            throw std::out_of_range("ByteSlice index out of bounds");
        }
        return mBytes[i];
    }
};
}
