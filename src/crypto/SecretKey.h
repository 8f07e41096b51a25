#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace tpuproxy
{

// An Ed25519 public key. This is the proxy's validator identity as seen by
// the destinations it connects to.
struct PublicKey
{
    std::array<uint8_t, 32> ed25519{};

    bool
    operator==(PublicKey const& rh) const
    {
        return ed25519 == rh.ed25519;
    }
    bool
    operator!=(PublicKey const& rh) const
    {
        return !(*this == rh);
    }
    bool
    operator<(PublicKey const& rh) const
    {
        return ed25519 < rh.ed25519;
    }
};

typedef std::vector<uint8_t> Signature;

class SecretKey
{
    using uint512 = std::array<uint8_t, 64>;
    using uint256 = std::array<uint8_t, 32>;

    // libsodium layout: 32 byte seed followed by the 32 byte public key. This
    // is also the on-disk "keypair" layout of the identity file.
    uint512 mSecretKey;
    PublicKey mPublicKey;

  public:
    SecretKey();
    ~SecretKey();
    SecretKey(SecretKey const&) = default;
    SecretKey& operator=(SecretKey const&) = default;

    // Get the public key portion of this secret key.
    PublicKey const& getPublicKey() const;

    // Get the public key portion of this secret key as a base58 string.
    std::string getPublicKeyBase58() const;

    // Get the seed portion of this secret key.
    uint256 getSeed() const;

    // The 64 byte seed||public keypair encoding.
    std::vector<uint8_t> getKeypairBytes() const;

    // Return true iff this key is all-zero.
    bool isZero() const;

    // Produce a signature of `bin` using this secret key.
    Signature sign(ByteSlice const& bin) const;

    // Create a new, random secret key.
    static SecretKey random();

#ifdef BUILD_TESTS
    // Same as random() but drawn from a function-local PRNG seeded from the
    // provided number. Do not under any circumstances use this for non-test
    // key generation.
    static SecretKey pseudoRandomForTestingFromSeed(unsigned int seed);
#endif

    // Decode a secret key from a binary seed value.
    static SecretKey fromSeed(ByteSlice const& seed);

    // Decode a 64 byte seed||public keypair. Throws CryptoError if the length
    // is wrong or the public half does not belong to the seed.
    static SecretKey fromKeypairBytes(ByteSlice const& keypair);

    // Decode a keypair written as a JSON array of 64 integers in [0, 255], as
    // produced by `gen-keypair`.
    static SecretKey fromJsonKeypair(std::string const& json);

    // Inverse of fromJsonKeypair.
    std::string toJsonKeypair() const;

    bool
    operator==(SecretKey const& rh) const
    {
        return mSecretKey == rh.mSecretKey;
    }
};

// public key utility functions
namespace PubKeyUtils
{
// Return true iff `signature` is valid for `bin` under `key`.
bool verifySig(PublicKey const& key, Signature const& signature,
               ByteSlice const& bin);

std::string toBase58(PublicKey const& key);

// Throws CryptoError if the string does not decode to exactly 32 bytes.
PublicKey fromBase58(std::string const& encoded);

PublicKey fromBytes(ByteSlice const& bytes);
}
}

namespace std
{
template <> struct hash<tpuproxy::PublicKey>
{
    size_t operator()(tpuproxy::PublicKey const& x) const noexcept;
};
}
