// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SecretKey.h"
#include "crypto/Base58.h"
#include "crypto/CryptoError.h"
#include "util/GlobalChecks.h"
#include "util/Math.h"

#include <algorithm>
#include <cstring>
#include <fmt/format.h>
#include <json/json.h>
#include <sodium.h>

namespace tpuproxy
{

SecretKey::SecretKey()
{
    static_assert(crypto_sign_PUBLICKEYBYTES == sizeof(uint256),
                  "Unexpected public key length");
    static_assert(crypto_sign_SEEDBYTES == sizeof(uint256),
                  "Unexpected seed length");
    static_assert(crypto_sign_SECRETKEYBYTES == sizeof(uint512),
                  "Unexpected secret key length");
    static_assert(crypto_sign_BYTES == sizeof(uint512),
                  "Unexpected signature length");
    mSecretKey.fill(0);
}

SecretKey::~SecretKey()
{
    sodium_memzero(mSecretKey.data(), mSecretKey.size());
}

PublicKey const&
SecretKey::getPublicKey() const
{
    return mPublicKey;
}

std::string
SecretKey::getPublicKeyBase58() const
{
    return PubKeyUtils::toBase58(mPublicKey);
}

SecretKey::uint256
SecretKey::getSeed() const
{
    uint256 seed;
    if (crypto_sign_ed25519_sk_to_seed(seed.data(), mSecretKey.data()) != 0)
    {
        throw CryptoError("error extracting seed from secret key");
    }
    return seed;
}

std::vector<uint8_t>
SecretKey::getKeypairBytes() const
{
    return std::vector<uint8_t>(mSecretKey.begin(), mSecretKey.end());
}

bool
SecretKey::isZero() const
{
    for (auto i : mSecretKey)
    {
        if (i != 0)
        {
            return false;
        }
    }
    return true;
}

Signature
SecretKey::sign(ByteSlice const& bin) const
{
    Signature out(crypto_sign_BYTES, 0);
    if (crypto_sign_detached(out.data(), NULL, bin.data(), bin.size(),
                             mSecretKey.data()) != 0)
    {
        throw CryptoError("error while signing");
    }
    return out;
}

SecretKey
SecretKey::random()
{
    SecretKey sk;
    if (crypto_sign_keypair(sk.mPublicKey.ed25519.data(),
                            sk.mSecretKey.data()) != 0)
    {
        throw CryptoError("error generating random secret key");
    }
    return sk;
}

#ifdef BUILD_TESTS
SecretKey
SecretKey::pseudoRandomForTestingFromSeed(unsigned int seed)
{
    // Reminder: this is not cryptographic randomness or even particularly hard
    // to guess PRNG-ness. It's intended for _deterministic_ use, when you want
    // "slightly random-ish" keys, for test-data generation.
    tpuproxy_default_random_engine tmpEngine(seed);
    std::vector<uint8_t> bytes;
    for (size_t i = 0; i < crypto_sign_SEEDBYTES; ++i)
    {
        bytes.push_back(static_cast<uint8_t>(tmpEngine()));
    }
    return SecretKey::fromSeed(bytes);
}
#endif

SecretKey
SecretKey::fromSeed(ByteSlice const& seed)
{
    SecretKey sk;

    if (seed.size() != crypto_sign_SEEDBYTES)
    {
        throw CryptoError("seed does not match byte size");
    }
    if (crypto_sign_seed_keypair(sk.mPublicKey.ed25519.data(),
                                 sk.mSecretKey.data(), seed.data()) != 0)
    {
        throw CryptoError("error generating secret key from seed");
    }
    return sk;
}

SecretKey
SecretKey::fromKeypairBytes(ByteSlice const& keypair)
{
    if (keypair.size() != crypto_sign_SECRETKEYBYTES)
    {
        throw CryptoError(fmt::format(
            FMT_STRING("keypair must be {} bytes, got {}"),
            static_cast<size_t>(crypto_sign_SECRETKEYBYTES), keypair.size()));
    }
    SecretKey sk =
        SecretKey::fromSeed(ByteSlice(keypair.data(), crypto_sign_SEEDBYTES));
    if (!std::equal(sk.mPublicKey.ed25519.begin(),
                    sk.mPublicKey.ed25519.end(),
                    keypair.begin() + crypto_sign_SEEDBYTES))
    {
        throw CryptoError("keypair public key does not match its seed");
    }
    return sk;
}

SecretKey
SecretKey::fromJsonKeypair(std::string const& json)
{
    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(json, root) || !root.isArray())
    {
        throw CryptoError("keypair is not a JSON array of bytes");
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(root.size());
    for (auto const& v : root)
    {
        if (!v.isIntegral() || v.asInt64() < 0 || v.asInt64() > 255)
        {
            throw CryptoError("keypair contains a value outside [0, 255]");
        }
        bytes.push_back(static_cast<uint8_t>(v.asUInt()));
    }
    auto sk = SecretKey::fromKeypairBytes(bytes);
    sodium_memzero(bytes.data(), bytes.size());
    return sk;
}

std::string
SecretKey::toJsonKeypair() const
{
    Json::Value root(Json::arrayValue);
    for (auto b : mSecretKey)
    {
        root.append(Json::UInt(b));
    }
    return Json::FastWriter().write(root);
}

namespace PubKeyUtils
{
bool
verifySig(PublicKey const& key, Signature const& signature,
          ByteSlice const& bin)
{
    if (signature.size() != crypto_sign_BYTES)
    {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), bin.data(),
                                       bin.size(), key.ed25519.data()) == 0;
}

std::string
toBase58(PublicKey const& key)
{
    return tpuproxy::toBase58(key.ed25519);
}

PublicKey
fromBase58(std::string const& encoded)
{
    std::vector<uint8_t> bytes;
    try
    {
        bytes = tpuproxy::fromBase58(encoded);
    }
    catch (std::runtime_error const& e)
    {
        throw CryptoError(fmt::format(FMT_STRING("invalid public key '{}': {}"),
                                      encoded, e.what()));
    }
    return fromBytes(bytes);
}

PublicKey
fromBytes(ByteSlice const& bytes)
{
    PublicKey pk;
    if (bytes.size() != pk.ed25519.size())
    {
        throw CryptoError(fmt::format(
            FMT_STRING("public key must be 32 bytes, got {}"), bytes.size()));
    }
    std::copy(bytes.begin(), bytes.end(), pk.ed25519.begin());
    return pk;
}
}
}

namespace std
{
size_t
hash<tpuproxy::PublicKey>::operator()(tpuproxy::PublicKey const& k) const
    noexcept
{
    size_t res = 0;
    std::memcpy(&res, k.ed25519.data(), sizeof(res));
    return res;
}
}
