// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/Base58.h"

#include <array>
#include <fmt/format.h>
#include <stdexcept>

namespace tpuproxy
{

namespace
{
char const BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

std::array<int8_t, 256>
makeDigitTable()
{
    std::array<int8_t, 256> table;
    table.fill(-1);
    for (int8_t i = 0; i < 58; ++i)
    {
        table[static_cast<uint8_t>(BASE58_ALPHABET[i])] = i;
    }
    return table;
}
}

// Both directions keep the number as a big-endian digit vector and fold one
// input symbol at a time into it (schoolbook base conversion).
std::string
toBase58(ByteSlice const& bin)
{
    size_t zeroes = 0;
    while (zeroes < bin.size() && bin.data()[zeroes] == 0)
    {
        ++zeroes;
    }

    // log(256) / log(58) < 138 / 100
    std::vector<uint8_t> digits((bin.size() - zeroes) * 138 / 100 + 1, 0);
    size_t used = 0;
    for (size_t i = zeroes; i < bin.size(); ++i)
    {
        uint32_t carry = bin.data()[i];
        size_t j = 0;
        for (auto it = digits.rbegin();
             (carry != 0 || j < used) && it != digits.rend(); ++it, ++j)
        {
            carry += 256u * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        used = j;
    }

    auto first = digits.begin() + (digits.size() - used);
    std::string res(zeroes, BASE58_ALPHABET[0]);
    res.reserve(zeroes + used);
    for (auto it = first; it != digits.end(); ++it)
    {
        res.push_back(BASE58_ALPHABET[*it]);
    }
    return res;
}

std::vector<uint8_t>
fromBase58(std::string const& encoded)
{
    static auto const table = makeDigitTable();

    size_t ones = 0;
    while (ones < encoded.size() && encoded[ones] == BASE58_ALPHABET[0])
    {
        ++ones;
    }

    // log(58) / log(256) < 733 / 1000
    std::vector<uint8_t> bytes((encoded.size() - ones) * 733 / 1000 + 1, 0);
    size_t used = 0;
    for (size_t i = ones; i < encoded.size(); ++i)
    {
        auto digit = table[static_cast<uint8_t>(encoded[i])];
        if (digit < 0)
        {
            throw std::runtime_error(fmt::format(
                FMT_STRING("invalid base58 character at offset {}"), i));
        }
        uint32_t carry = static_cast<uint32_t>(digit);
        size_t j = 0;
        for (auto it = bytes.rbegin();
             (carry != 0 || j < used) && it != bytes.rend(); ++it, ++j)
        {
            carry += 58u * (*it);
            *it = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        used = j;
    }

    std::vector<uint8_t> res(ones, 0);
    res.insert(res.end(), bytes.end() - used, bytes.end());
    return res;
}
}
