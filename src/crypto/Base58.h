#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"

#include <string>
#include <vector>

namespace tpuproxy
{

// Validator identities are displayed and configured in plain (unchecked)
// base58 with the bitcoin alphabet. Each leading zero byte maps to a leading
// '1' and back.
std::string toBase58(ByteSlice const& bin);

// Throws std::runtime_error on characters outside the alphabet.
std::vector<uint8_t> fromBase58(std::string const& encoded);
}
