// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/TlsCertificate.h"
#include "crypto/CryptoError.h"
#include "crypto/Random.h"
#include "util/Logging.h"

#include <fmt/format.h>
#include <gnutls/x509.h>

namespace tpuproxy
{

namespace
{
// Certificates are "valid" from an hour in the past so that peers with a
// slightly skewed clock accept them, and until the far future since the key
// itself is the only thing validators look at.
std::chrono::hours const NOT_BEFORE_SKEW(1);
std::time_t const FAR_FUTURE_EXPIRY = 4102444800; // 2100-01-01T00:00:00Z

void
check(int rc, char const* what)
{
    if (rc < 0)
    {
        throw CryptoError(fmt::format(FMT_STRING("{} failed: {}"), what,
                                      gnutls_strerror(rc)));
    }
}

struct PrivKey
{
    gnutls_x509_privkey_t mKey{nullptr};
    PrivKey()
    {
        check(gnutls_x509_privkey_init(&mKey), "gnutls_x509_privkey_init");
    }
    ~PrivKey()
    {
        gnutls_x509_privkey_deinit(mKey);
    }
};

struct Crt
{
    gnutls_x509_crt_t mCrt{nullptr};
    Crt()
    {
        check(gnutls_x509_crt_init(&mCrt), "gnutls_x509_crt_init");
    }
    ~Crt()
    {
        gnutls_x509_crt_deinit(mCrt);
    }
};

gnutls_datum_t
datum(ByteSlice const& bytes)
{
    gnutls_datum_t d;
    d.data = const_cast<unsigned char*>(bytes.data());
    d.size = static_cast<unsigned int>(bytes.size());
    return d;
}

void
importIdentityKey(PrivKey& priv, SecretKey const& key)
{
    auto seed = key.getSeed();
    auto pub = key.getPublicKey().ed25519;
    gnutls_datum_t x = datum(pub);
    gnutls_datum_t k = datum(seed);
    int rc = gnutls_x509_privkey_import_ecc_raw(
        priv.mKey, GNUTLS_ECC_CURVE_ED25519, &x, nullptr, &k);
    seed.fill(0);
    check(rc, "gnutls_x509_privkey_import_ecc_raw");
}
}

TlsCertificate::TlsCertificate(SecretKey const& key,
                               std::string const& commonName,
                               std::chrono::system_clock::time_point now)
    : mPublicKey(key.getPublicKey())
{
    PrivKey priv;
    importIdentityKey(priv, key);

    Crt crt;
    check(gnutls_x509_crt_set_version(crt.mCrt, 3),
          "gnutls_x509_crt_set_version");

    auto serial = randomBytes(16);
    // Keep the serial a positive DER INTEGER.
    serial[0] &= 0x7f;
    serial[0] |= 0x01;
    check(gnutls_x509_crt_set_serial(crt.mCrt, serial.data(), serial.size()),
          "gnutls_x509_crt_set_serial");

    auto notBefore = std::chrono::system_clock::to_time_t(now - NOT_BEFORE_SKEW);
    check(gnutls_x509_crt_set_activation_time(crt.mCrt, notBefore),
          "gnutls_x509_crt_set_activation_time");
    check(gnutls_x509_crt_set_expiration_time(crt.mCrt, FAR_FUTURE_EXPIRY),
          "gnutls_x509_crt_set_expiration_time");

    check(gnutls_x509_crt_set_dn_by_oid(
              crt.mCrt, GNUTLS_OID_X520_COMMON_NAME, 0, commonName.data(),
              static_cast<unsigned int>(commonName.size())),
          "gnutls_x509_crt_set_dn_by_oid");
    static char const localhost[] = "localhost";
    check(gnutls_x509_crt_set_subject_alt_name(
              crt.mCrt, GNUTLS_SAN_DNSNAME, localhost, sizeof(localhost) - 1,
              GNUTLS_FSAN_SET),
          "gnutls_x509_crt_set_subject_alt_name");
    check(gnutls_x509_crt_set_basic_constraints(crt.mCrt, 0, -1),
          "gnutls_x509_crt_set_basic_constraints");
    check(gnutls_x509_crt_set_key(crt.mCrt, priv.mKey),
          "gnutls_x509_crt_set_key");
    check(gnutls_x509_crt_sign2(crt.mCrt, crt.mCrt, priv.mKey,
                                GNUTLS_DIG_SHA512, 0),
          "gnutls_x509_crt_sign2");

    gnutls_datum_t out{nullptr, 0};
    check(gnutls_x509_crt_export2(crt.mCrt, GNUTLS_X509_FMT_DER, &out),
          "gnutls_x509_crt_export2");
    mDer.assign(out.data, out.data + out.size);
    gnutls_free(out.data);

    check(gnutls_certificate_allocate_credentials(&mCredentials),
          "gnutls_certificate_allocate_credentials");
    int rc = gnutls_certificate_set_x509_key(mCredentials, &crt.mCrt, 1,
                                             priv.mKey);
    if (rc < 0)
    {
        gnutls_certificate_free_credentials(mCredentials);
        mCredentials = nullptr;
        check(rc, "gnutls_certificate_set_x509_key");
    }

    CLOG_DEBUG(Identity, "Generated {} byte self-signed certificate CN={}",
               mDer.size(), commonName);
}

TlsCertificate::~TlsCertificate()
{
    if (mCredentials)
    {
        gnutls_certificate_free_credentials(mCredentials);
    }
}

std::vector<uint8_t> const&
TlsCertificate::getDer() const
{
    return mDer;
}

PublicKey const&
TlsCertificate::getPublicKey() const
{
    return mPublicKey;
}

gnutls_certificate_credentials_t
TlsCertificate::getCredentials() const
{
    return mCredentials;
}

PublicKey
TlsCertificate::extractPublicKey(ByteSlice const& der)
{
    Crt crt;
    gnutls_datum_t in = datum(der);
    check(gnutls_x509_crt_import(crt.mCrt, &in, GNUTLS_X509_FMT_DER),
          "gnutls_x509_crt_import");
    if (gnutls_x509_crt_get_pk_algorithm(crt.mCrt, nullptr) !=
        GNUTLS_PK_EDDSA_ED25519)
    {
        throw CryptoError("certificate key is not Ed25519");
    }
    gnutls_ecc_curve_t curve;
    gnutls_datum_t x{nullptr, 0};
    gnutls_datum_t y{nullptr, 0};
    check(gnutls_x509_crt_get_pk_ecc_raw(crt.mCrt, &curve, &x, &y),
          "gnutls_x509_crt_get_pk_ecc_raw");
    std::vector<uint8_t> raw(x.data, x.data + x.size);
    gnutls_free(x.data);
    gnutls_free(y.data);
    return PubKeyUtils::fromBytes(raw);
}
}
