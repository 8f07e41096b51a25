#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SecretKey.h"
#include "crypto/TlsCertificate.h"

#include <chrono>
#include <memory>
#include <string>

namespace tpuproxy
{

/**
 * Holds the proxy's one identity keypair and the self-signed certificate
 * derived from it. Both are created once, before any connection is opened,
 * and never change afterwards; everything that opens a QUIC session borrows
 * them by const reference.
 */
class IdentityProvider
{
    SecretKey const mIdentity;
    std::unique_ptr<TlsCertificate const> mCertificate;

  public:
    IdentityProvider(SecretKey const& identity, std::string const& commonName,
                     std::chrono::system_clock::time_point now);

    SecretKey const& identity() const;

    // Returns the certificate bound to `identity`. The proxy has exactly one
    // identity; asking for any other throws std::invalid_argument.
    TlsCertificate const& certificateFor(SecretKey const& identity) const;

    // Resolves the identity keypair: the IDENTITY environment variable
    // (either an inline JSON byte array or a path to a file holding one),
    // else `keypairFile` when non-empty, else a fresh random keypair.
    // Malformed material throws CryptoError.
    static SecretKey loadIdentity(std::string const& keypairFile);

    static SecretKey loadKeypairFile(std::string const& path);
};
}
