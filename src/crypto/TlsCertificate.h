#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"
#include "crypto/SecretKey.h"

#include <chrono>
#include <gnutls/gnutls.h>
#include <string>
#include <vector>

namespace tpuproxy
{

/**
 * A self-signed X.509 certificate whose subject public key is the proxy's
 * Ed25519 identity key. Validators classify the QUIC client by the key in
 * this certificate, so there is no CA involved: the certificate is only a
 * vehicle for the public key.
 *
 * The certificate also carries the GnuTLS credentials object that every
 * outbound QUIC session presents as its client certificate.
 */
class TlsCertificate
{
    std::vector<uint8_t> mDer;
    PublicKey mPublicKey;
    gnutls_certificate_credentials_t mCredentials{nullptr};

  public:
    TlsCertificate(SecretKey const& key, std::string const& commonName,
                   std::chrono::system_clock::time_point now);
    ~TlsCertificate();
    TlsCertificate(TlsCertificate const&) = delete;
    TlsCertificate& operator=(TlsCertificate const&) = delete;

    std::vector<uint8_t> const& getDer() const;
    PublicKey const& getPublicKey() const;
    gnutls_certificate_credentials_t getCredentials() const;

    // Parses a DER certificate and returns its Ed25519 subject key. Throws
    // CryptoError for anything that is not an Ed25519 certificate.
    static PublicKey extractPublicKey(ByteSlice const& der);
};
}
