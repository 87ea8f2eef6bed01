#include <cstddef>
#include <cstring>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "zff/core/errors.hpp"
#include "zff/security/kdf.hpp"
#include "zff/security/keyring.hpp"

namespace {
static zff::security::Key256 make_key256_seq(zff::core::u8 start) {
    zff::security::Key256 k{};
    for (size_t i = 0; i < 32; ++i) {
        k.b[i] = static_cast<zff::core::u8>(start + static_cast<zff::core::u8>(i));
    }
    return k;
}

static std::string key_hex(const zff::security::Key256& k) {
    static const char digits[] = "0123456789abcdef";
    std::string s;
    for (zff::core::u8 b : k.b) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0xF]);
    }
    return s;
}

static std::vector<zff::core::u8> bytes_of(const char* s) {
    return std::vector<zff::core::u8>(s, s + std::strlen(s));
}
} // namespace

//====
// Expansion
//====

TEST(SecurityKdf, ExpandRejectsNullOut) {
    const zff::security::Key256 ikm = make_key256_seq(1);
    const zff::core::Status s = zff::security::hkdf_expand(ikm, {nullptr, 0}, {nullptr, 0}, nullptr);
    EXPECT_EQ(s.domain, zff::core::StatusDomain::Security);
    EXPECT_EQ(s.code, zff::core::StatusCode::Invalid);
}

TEST(SecurityKdf, ExpandRejectsNullSaltWhenLenNonZero) {
    const zff::security::Key256 ikm = make_key256_seq(1);
    zff::security::Key256 out{};
    const zff::core::Status s = zff::security::hkdf_expand(ikm, {nullptr, 1}, {nullptr, 0}, &out);
    EXPECT_EQ(s.code, zff::core::StatusCode::Invalid);
}

TEST(SecurityKdf, ObjectKeysAreDistinctAndStable) {
    const zff::security::Key256 master = make_key256_seq(1);
    zff::security::Key256 a{};
    zff::security::Key256 b{};
    zff::security::Key256 again{};
    ASSERT_TRUE(zff::core::is_ok(zff::security::derive_object_key(master, 1, &a)));
    ASSERT_TRUE(zff::core::is_ok(zff::security::derive_object_key(master, 2, &b)));
    ASSERT_TRUE(zff::core::is_ok(zff::security::derive_object_key(master, 1, &again)));
    EXPECT_EQ(key_hex(a), key_hex(again));
    EXPECT_NE(key_hex(a), key_hex(b));
    EXPECT_NE(key_hex(a), key_hex(master));
}

//====
// Password kdfs
//====

TEST(SecurityKdf, Pbkdf2Sha256Vector) {
    zff::core::KdfParams p{};
    p.kdf = zff::core::KdfId::Pbkdf2Sha256;
    p.salt = bytes_of("salt");
    p.iterations = 1;
    zff::security::Key256 out{};
    ASSERT_TRUE(zff::core::is_ok(zff::security::derive_password_key(p, "password", &out)));
    EXPECT_EQ(key_hex(out), "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");
}

TEST(SecurityKdf, ScryptVector) {
    zff::core::KdfParams p{};
    p.kdf = zff::core::KdfId::Scrypt;
    p.salt = bytes_of("NaCl");
    p.log_n = 10;
    p.r = 8;
    p.p = 16;
    zff::security::Key256 out{};
    ASSERT_TRUE(zff::core::is_ok(zff::security::derive_password_key(p, "password", &out)));
    // first 32 bytes of the 64 byte reference output
    EXPECT_EQ(key_hex(out), "fdbabe1c9d3472007856e7190d01e9fe7c6ad7cbc8237830e77376634b373162");
}

TEST(SecurityKdf, Argon2idIsDeterministicForASalt) {
    zff::core::KdfParams p{};
    p.kdf = zff::core::KdfId::Argon2id;
    p.salt.assign(16, 0x42);
    p.iterations = 2;
    p.memory_kib = 8 * 1024;
    p.lanes = 1;
    zff::security::Key256 a{};
    zff::security::Key256 b{};
    ASSERT_TRUE(zff::core::is_ok(zff::security::derive_password_key(p, "hunter2", &a)));
    ASSERT_TRUE(zff::core::is_ok(zff::security::derive_password_key(p, "hunter2", &b)));
    EXPECT_EQ(key_hex(a), key_hex(b));

    zff::security::Key256 other{};
    ASSERT_TRUE(zff::core::is_ok(zff::security::derive_password_key(p, "hunter3", &other)));
    EXPECT_NE(key_hex(a), key_hex(other));
}

TEST(SecurityKdf, Argon2idRejectsUnsupportedShapes) {
    zff::core::KdfParams p{};
    p.kdf = zff::core::KdfId::Argon2id;
    p.salt.assign(8, 0x42);
    p.iterations = 2;
    p.memory_kib = 8 * 1024;
    p.lanes = 1;
    zff::security::Key256 out{};
    EXPECT_EQ(zff::security::derive_password_key(p, "pw", &out).code, zff::core::StatusCode::Invalid);

    p.salt.assign(16, 0x42);
    p.lanes = 4;
    EXPECT_EQ(zff::security::derive_password_key(p, "pw", &out).code, zff::core::StatusCode::Invalid);

    p.lanes = 1;
    p.iterations = 0;
    EXPECT_EQ(zff::security::derive_password_key(p, "pw", &out).code, zff::core::StatusCode::Invalid);
}

TEST(SecurityKdf, RejectsBadParameters) {
    zff::security::Key256 out{};
    zff::core::KdfParams none{};
    EXPECT_EQ(zff::security::derive_password_key(none, "pw", &out).code, zff::core::StatusCode::Invalid);

    zff::core::KdfParams pbkdf2{};
    pbkdf2.kdf = zff::core::KdfId::Pbkdf2Sha256;
    pbkdf2.salt.assign(16, 1);
    pbkdf2.iterations = 0;
    EXPECT_EQ(zff::security::derive_password_key(pbkdf2, "pw", &out).code, zff::core::StatusCode::Invalid);
    pbkdf2.iterations = 0x80000000u;
    EXPECT_EQ(zff::security::derive_password_key(pbkdf2, "pw", &out).code, zff::core::StatusCode::Invalid);

    zff::core::KdfParams scrypt{};
    scrypt.kdf = zff::core::KdfId::Scrypt;
    scrypt.salt.assign(16, 1);
    scrypt.log_n = 0;
    scrypt.r = 8;
    scrypt.p = 1;
    EXPECT_EQ(zff::security::derive_password_key(scrypt, "pw", &out).code, zff::core::StatusCode::Invalid);
}

TEST(SecurityKdf, DefaultsCarryFreshSalt) {
    zff::core::KdfParams a{};
    zff::core::KdfParams b{};
    ASSERT_TRUE(zff::core::is_ok(zff::security::default_kdf_params(zff::core::KdfId::Pbkdf2Sha256, &a)));
    ASSERT_TRUE(zff::core::is_ok(zff::security::default_kdf_params(zff::core::KdfId::Pbkdf2Sha256, &b)));
    EXPECT_EQ(a.iterations, 310000u);
    EXPECT_EQ(a.salt.size(), zff::security::kKdfSaltBytes);
    EXPECT_NE(a.salt, b.salt);

    zff::core::KdfParams s{};
    ASSERT_TRUE(zff::core::is_ok(zff::security::default_kdf_params(zff::core::KdfId::Scrypt, &s)));
    EXPECT_EQ(s.log_n, 15);
    EXPECT_EQ(s.r, 8u);
    EXPECT_EQ(s.p, 1u);

    zff::core::KdfParams g{};
    ASSERT_TRUE(zff::core::is_ok(zff::security::default_kdf_params(zff::core::KdfId::Argon2id, &g)));
    EXPECT_EQ(g.lanes, 1u);
    EXPECT_GT(g.memory_kib, 0u);
}

//====
// Key ring
//====

TEST(SecurityKeyRing, PerObjectBeatsDefault) {
    zff::security::KeyRing ring;
    EXPECT_EQ(ring.lookup(1), nullptr);

    ring.set_default(zff::security::key_from_password("outer"));
    ring.set_for_object(2, zff::security::key_from_raw(make_key256_seq(5)));

    const zff::security::KeyMaterial* one = ring.lookup(1);
    ASSERT_NE(one, nullptr);
    EXPECT_EQ(one->password, "outer");

    const zff::security::KeyMaterial* two = ring.lookup(2);
    ASSERT_NE(two, nullptr);
    EXPECT_TRUE(two->has_raw_key);
    EXPECT_EQ(two->raw_key.b[0], 5);
}

TEST(SecurityKeyRing, EmptyEntryFallsBack) {
    zff::security::KeyRing ring;
    ring.set_default(zff::security::key_from_password("outer"));
    ring.set_for_object(3, zff::security::KeyMaterial{});
    const zff::security::KeyMaterial* m = ring.lookup(3);
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(m->password, "outer");
}
