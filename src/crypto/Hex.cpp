// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/Hex.h"
#include <algorithm>
#include <fmt/format.h>
#include <sodium.h>

namespace tpuproxy
{

static size_t const ABBREV_BYTES = 3;

std::string
binToHex(ByteSlice const& bin)
{
    if (bin.empty())
    {
        return std::string();
    }
    // sodium_bin2hex writes a trailing NUL.
    std::vector<char> out(2 * bin.size() + 1);
    if (!sodium_bin2hex(out.data(), out.size(), bin.data(), bin.size()))
    {
        throw std::runtime_error("binToHex: encoding failed");
    }
    return std::string(out.data(), 2 * bin.size());
}

std::string
hexAbbrev(ByteSlice const& bin)
{
    return binToHex(
        ByteSlice(bin.data(), std::min<size_t>(bin.size(), ABBREV_BYTES)));
}

std::vector<uint8_t>
hexToBin(std::string const& hex)
{
    if (hex.size() % 2 != 0)
    {
        throw std::runtime_error(fmt::format(
            FMT_STRING("hexToBin: odd length {}"), hex.size()));
    }
    std::vector<uint8_t> out(hex.size() / 2);
    size_t written = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(),
                       nullptr, &written, nullptr) != 0 ||
        written != out.size())
    {
        throw std::runtime_error("hexToBin: invalid hex digit");
    }
    return out;
}
}
