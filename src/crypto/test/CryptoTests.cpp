// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/Base58.h"
#include "crypto/CryptoError.h"
#include "crypto/Hex.h"
#include "crypto/IdentityProvider.h"
#include "crypto/Random.h"
#include "crypto/SecretKey.h"
#include "crypto/TlsCertificate.h"
#include "test/Catch2.h"
#include "test/test.h"
#include "util/Logging.h"
#include <autocheck/autocheck.hpp>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <map>
#include <sodium.h>
#include <stdexcept>

using namespace tpuproxy;

static std::map<std::vector<uint8_t>, std::string> hexTestVectors = {
    {{}, ""},
    {{0x72}, "72"},
    {{0x54, 0x4c}, "544c"},
    {{0x34, 0x75, 0x52, 0x45, 0x34, 0x75}, "347552453475"},
    {{0x4f, 0x46, 0x79, 0x58, 0x43, 0x6d, 0x68, 0x37, 0x51},
     "4f467958436d683751"}};

TEST_CASE("random", "[identity]")
{
    SecretKey k1 = SecretKey::random();
    SecretKey k2 = SecretKey::random();
    CLOG_DEBUG(Identity, "k1: {}", k1.getPublicKeyBase58());
    CLOG_DEBUG(Identity, "k2: {}", k2.getPublicKeyBase58());
    CHECK(!(k1 == k2));
    CHECK(!k1.isZero());

    auto r1 = randomBytes(32);
    auto r2 = randomBytes(32);
    CHECK(r1.size() == 32);
    CHECK(r1 != r2);
}

TEST_CASE("hex tests", "[identity]")
{
    // Do some fixed test vectors.
    for (auto const& pair : hexTestVectors)
    {
        CLOG_DEBUG(Identity, "fixed test vector hex: \"{}\"", pair.second);

        auto enc = binToHex(pair.first);
        CHECK(enc.size() == pair.second.size());
        CHECK(enc == pair.second);

        auto dec = hexToBin(pair.second);
        CHECK(pair.first == dec);
    }

    // Do 20 random round-trip tests.
    autocheck::check<std::vector<uint8_t>>(
        [](std::vector<uint8_t> v) {
            auto enc = binToHex(v);
            auto dec = hexToBin(enc);
            CLOG_DEBUG(Identity, "random round-trip hex: \"{}\"", enc);
            CHECK(v == dec);
            return v == dec;
        },
        20);
}

TEST_CASE("base58 tests", "[identity]")
{
    CHECK(toBase58(std::vector<uint8_t>{}) == "");
    CHECK(toBase58(std::string("Hello World!")) == "2NEpo7TZRRrLZSi2U");
    // Each leading zero byte encodes as a leading '1'.
    CHECK(toBase58(std::vector<uint8_t>{0, 0, 0}) == "111");
    CHECK(fromBase58("111") == std::vector<uint8_t>{0, 0, 0});

    auto hello = fromBase58("2NEpo7TZRRrLZSi2U");
    CHECK(std::string(hello.begin(), hello.end()) == "Hello World!");

    // '0', 'O', 'I' and 'l' are not part of the alphabet.
    REQUIRE_THROWS(fromBase58("0OIl"));

    autocheck::check<std::vector<uint8_t>>(
        [](std::vector<uint8_t> v) {
            auto dec = fromBase58(toBase58(v));
            CHECK(v == dec);
            return v == dec;
        },
        20);
}

TEST_CASE("sign and verify", "[identity]")
{
    SecretKey sk = SecretKey::random();
    PublicKey pk = sk.getPublicKey();
    CLOG_DEBUG(Identity, "generated random secret key seed: {}",
               binToHex(sk.getSeed()));
    CLOG_DEBUG(Identity, "corresponding public key: {}",
               PubKeyUtils::toBase58(pk));

    CHECK(SecretKey::fromSeed(sk.getSeed()) == sk);

    std::string msg = "hello";
    auto sig = sk.sign(msg);

    CLOG_DEBUG(Identity, "formed signature: {}", binToHex(sig));

    CLOG_DEBUG(Identity, "checking signature-verify");
    CHECK(PubKeyUtils::verifySig(pk, sig, msg));

    CLOG_DEBUG(Identity, "checking verify-failure on bad message");
    CHECK(!PubKeyUtils::verifySig(pk, sig, std::string("helloo")));

    CLOG_DEBUG(Identity, "checking verify-failure on bad signature");
    sig[4] ^= 1;
    CHECK(!PubKeyUtils::verifySig(pk, sig, msg));

    CLOG_DEBUG(Identity, "checking verify-failure with wrong PK");
    PublicKey pk2 = SecretKey::random().getPublicKey();
    CHECK(!PubKeyUtils::verifySig(pk2, sig, msg));
}

TEST_CASE("RFC 8032 test vector", "[identity]")
{
    auto seed = hexToBin(
        "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    auto pub = hexToBin(
        "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
    auto expectedSig = hexToBin(
        "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb882"
        "1590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");

    auto sk = SecretKey::fromSeed(seed);
    CHECK(sk.getPublicKey() == PubKeyUtils::fromBytes(pub));

    auto sig = sk.sign(std::string());
    CHECK(sig == expectedSig);
    CHECK(PubKeyUtils::verifySig(sk.getPublicKey(), sig, std::string()));
}

TEST_CASE("keypair encodings", "[identity]")
{
    auto sk = SecretKey::random();

    SECTION("64 byte keypair")
    {
        auto bytes = sk.getKeypairBytes();
        REQUIRE(bytes.size() == 64);
        CHECK(std::equal(bytes.begin() + 32, bytes.end(),
                         sk.getPublicKey().ed25519.begin()));
        CHECK(SecretKey::fromKeypairBytes(bytes) == sk);

        bytes.resize(63);
        REQUIRE_THROWS_AS(SecretKey::fromKeypairBytes(bytes), CryptoError);
    }

    SECTION("mismatched public half")
    {
        auto bytes = sk.getKeypairBytes();
        bytes[40] ^= 0xff;
        REQUIRE_THROWS_AS(SecretKey::fromKeypairBytes(bytes), CryptoError);
    }

    SECTION("json keypair")
    {
        auto json = sk.toJsonKeypair();
        CHECK(json.front() == '[');
        CHECK(SecretKey::fromJsonKeypair(json) == sk);

        REQUIRE_THROWS_AS(SecretKey::fromJsonKeypair("{}"), CryptoError);
        REQUIRE_THROWS_AS(SecretKey::fromJsonKeypair("[1, 2, 3]"),
                          CryptoError);
        REQUIRE_THROWS_AS(SecretKey::fromJsonKeypair("[256]"), CryptoError);
        REQUIRE_THROWS_AS(SecretKey::fromJsonKeypair("not json"),
                          CryptoError);
    }

    SECTION("base58 public key")
    {
        auto b58 = sk.getPublicKeyBase58();
        CHECK(b58 == PubKeyUtils::toBase58(sk.getPublicKey()));
        CHECK(PubKeyUtils::fromBase58(b58) == sk.getPublicKey());
        REQUIRE_THROWS_AS(PubKeyUtils::fromBase58("2NEpo7TZRRrLZSi2U"),
                          CryptoError);
    }
}

TEST_CASE("self-signed certificate carries the identity key", "[identity]")
{
    auto sk = SecretKey::random();
    auto now = std::chrono::system_clock::now();
    TlsCertificate cert(sk, "tpu-forward-proxy", now);

    CHECK(!cert.getDer().empty());
    CHECK(cert.getCredentials() != nullptr);
    CHECK(cert.getPublicKey() == sk.getPublicKey());
    CHECK(TlsCertificate::extractPublicKey(cert.getDer()) ==
          sk.getPublicKey());

    auto garbage = cert.getDer();
    garbage.resize(garbage.size() / 2);
    REQUIRE_THROWS_AS(TlsCertificate::extractPublicKey(garbage), CryptoError);
}

TEST_CASE("identity provider", "[identity]")
{
    auto now = std::chrono::system_clock::now();
    auto sk = SecretKey::random();
    IdentityProvider ip(sk, "tpu-forward-proxy", now);

    CHECK(ip.identity() == sk);
    auto const& cert = ip.certificateFor(sk);
    CHECK(TlsCertificate::extractPublicKey(cert.getDer()) ==
          sk.getPublicKey());
    // The same certificate is handed out every time.
    CHECK(&ip.certificateFor(sk) == &cert);

    REQUIRE_THROWS_AS(ip.certificateFor(SecretKey::random()),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(IdentityProvider(SecretKey(), "x", now), CryptoError);
}

TEST_CASE("identity loading", "[identity]")
{
    auto sk = SecretKey::random();
    auto path = std::filesystem::temp_directory_path() /
                fmt::format("tpu-proxy-identity-{}.json",
                            binToHex(randomBytes(8)));
    {
        std::ofstream out(path);
        out << sk.toJsonKeypair();
    }
    unsetenv("IDENTITY");

    SECTION("from keypair file")
    {
        CHECK(IdentityProvider::loadIdentity(path.string()) == sk);
    }
    SECTION("missing file")
    {
        REQUIRE_THROWS_AS(
            IdentityProvider::loadIdentity((path / "missing").string()),
            CryptoError);
    }
    SECTION("IDENTITY holding a path wins over the file")
    {
        auto other = SecretKey::random();
        auto otherPath = path;
        otherPath += ".other";
        {
            std::ofstream out(otherPath);
            out << other.toJsonKeypair();
        }
        setenv("IDENTITY", otherPath.string().c_str(), 1);
        CHECK(IdentityProvider::loadIdentity(path.string()) == other);
        unsetenv("IDENTITY");
        std::filesystem::remove(otherPath);
    }
    SECTION("IDENTITY holding an inline keypair")
    {
        auto other = SecretKey::random();
        setenv("IDENTITY", other.toJsonKeypair().c_str(), 1);
        CHECK(IdentityProvider::loadIdentity("") == other);
        unsetenv("IDENTITY");
    }
    SECTION("nothing configured generates a fresh key")
    {
        auto k1 = IdentityProvider::loadIdentity("");
        auto k2 = IdentityProvider::loadIdentity("");
        CHECK(!k1.isZero());
        CHECK(!(k1 == k2));
    }

    std::filesystem::remove(path);
}
