// STARDUST - SHA256 and HMAC Tests
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include <gtest/gtest.h>
#include "stardust/crypto/sha256.h"
#include "stardust/crypto/hmac.h"
#include "stardust/core/types.h"
#include "stardust/core/hex.h"

#include <string>
#include <vector>
#include <array>

namespace stardust {
namespace test {

namespace {

std::vector<Byte> StringBytes(const std::string& s) {
    return std::vector<Byte>(s.begin(), s.end());
}

std::string DigestHex(const std::string& input) {
    Hash256 h = SHA256Hash(StringBytes(input));
    return h.ToHex().substr(2);
}

} // namespace

// ============================================================================
// SHA256 Known Answers
// ============================================================================

TEST(SHA256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(SHA256::OUTPUT_SIZE, 32u);
}

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(DigestHex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(DigestHex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(DigestHex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, MillionAs) {
    SHA256 hasher;
    std::vector<Byte> chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) {
        hasher.Write(chunk);
    }
    Hash256 h;
    hasher.Finalize(h.data());
    EXPECT_EQ(h.ToHex(),
              "0xcdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    auto data = StringBytes("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq");

    SHA256 hasher;
    hasher.Write(data.data(), 10).Write(data.data() + 10, data.size() - 10);
    Hash256 incremental;
    hasher.Finalize(incremental.data());

    EXPECT_EQ(incremental, SHA256Hash(data));
}

TEST(SHA256Test, ResetAllowsReuse) {
    SHA256 hasher;
    hasher.Write(StringBytes("garbage"));
    Hash256 first;
    hasher.Finalize(first.data());

    hasher.Reset().Write(StringBytes("abc"));
    Hash256 second;
    hasher.Finalize(second.data());
    EXPECT_EQ(second.ToHex().substr(2),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// ============================================================================
// HMAC-SHA512 (RFC 4231)
// ============================================================================

TEST(HmacSha512Test, Rfc4231Case2) {
    auto key = StringBytes("Jefe");
    auto data = StringBytes("what do ya want for nothing?");
    auto mac = HmacSha512(key.data(), key.size(), data.data(), data.size());
    EXPECT_EQ(BytesToHex(std::vector<Byte>(mac.begin(), mac.end())),
              "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea250554"
              "9758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737");
}

TEST(HmacSha512Test, KeySensitive) {
    auto data = StringBytes("message");
    auto k1 = StringBytes("key1");
    auto k2 = StringBytes("key2");
    EXPECT_NE(HmacSha512(k1.data(), k1.size(), data.data(), data.size()),
              HmacSha512(k2.data(), k2.size(), data.data(), data.size()));
}

} // namespace test
} // namespace stardust
