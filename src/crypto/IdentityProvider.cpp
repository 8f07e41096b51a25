// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/IdentityProvider.h"
#include "crypto/CryptoError.h"
#include "util/Logging.h"

#include <cstdlib>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tpuproxy
{

IdentityProvider::IdentityProvider(SecretKey const& identity,
                                   std::string const& commonName,
                                   std::chrono::system_clock::time_point now)
    : mIdentity(identity)
{
    if (mIdentity.isZero())
    {
        throw CryptoError("identity keypair is all zero");
    }
    mCertificate =
        std::make_unique<TlsCertificate const>(mIdentity, commonName, now);
    CLOG_INFO(Identity, "Proxy identity {}", mIdentity.getPublicKeyBase58());
}

SecretKey const&
IdentityProvider::identity() const
{
    return mIdentity;
}

TlsCertificate const&
IdentityProvider::certificateFor(SecretKey const& identity) const
{
    if (identity.getPublicKey() != mIdentity.getPublicKey())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("no certificate for identity {}"),
                        identity.getPublicKeyBase58()));
    }
    return *mCertificate;
}

SecretKey
IdentityProvider::loadKeypairFile(std::string const& path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw CryptoError(
            fmt::format(FMT_STRING("cannot open keypair file '{}'"), path));
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return SecretKey::fromJsonKeypair(buf.str());
}

SecretKey
IdentityProvider::loadIdentity(std::string const& keypairFile)
{
    if (char const* env = std::getenv("IDENTITY"))
    {
        std::string value(env);
        auto first = value.find_first_not_of(" \t\r\n");
        if (first != std::string::npos && value[first] == '[')
        {
            CLOG_INFO(Identity, "Loading identity from IDENTITY keypair");
            return SecretKey::fromJsonKeypair(value);
        }
        CLOG_INFO(Identity, "Loading identity from file '{}' (IDENTITY)",
                  value);
        return loadKeypairFile(value);
    }
    if (!keypairFile.empty())
    {
        CLOG_INFO(Identity, "Loading identity from file '{}'", keypairFile);
        return loadKeypairFile(keypairFile);
    }
    auto key = SecretKey::random();
    CLOG_INFO(Identity, "No identity configured, generated {}",
              key.getPublicKeyBase58());
    return key;
}
}
