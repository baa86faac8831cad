// STARDUST - Secure Signer Tests
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include <gtest/gtest.h>
#include "stardust/wallet/signer.h"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace stardust {
namespace wallet {
namespace test {

namespace {

/// Low iteration count so the suite stays fast
constexpr uint32_t TEST_KDF_ITERATIONS = 1000;

std::array<Byte, MASTER_SEED_SIZE> TestSeed() {
    std::array<Byte, MASTER_SEED_SIZE> seed{};
    for (size_t i = 0; i < seed.size(); ++i) {
        seed[i] = static_cast<Byte>(i * 7 + 1);
    }
    return seed;
}

Hash256 TestMessage() {
    return Hash256::FromHex(std::string(64, 'e'));
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class SignerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend = std::make_shared<MemorySecretBackend>();
        signer.reset(new SecureSigner(backend, TEST_KDF_ITERATIONS));
        ASSERT_TRUE(signer->Initialize("correct horse", TestSeed()));
    }

    std::shared_ptr<MemorySecretBackend> backend;
    std::unique_ptr<SecureSigner> signer;
};

// ============================================================================
// Unlock
// ============================================================================

TEST_F(SignerTest, UnlockWithCorrectPassphrase) {
    auto result = signer->Unlock("correct horse");
    ASSERT_TRUE(result.success) << result.message;
    ASSERT_TRUE(result.session.has_value());
    EXPECT_TRUE(result.session->IsActive());
}

TEST_F(SignerTest, WrongPassphraseRejected) {
    auto result = signer->Unlock("battery staple");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::WrongPassphrase);
    EXPECT_FALSE(result.session.has_value());
}

TEST_F(SignerTest, UninitializedStoreReportsWrongPassphrase) {
    SecureSigner empty(std::make_shared<MemorySecretBackend>(), TEST_KDF_ITERATIONS);
    EXPECT_FALSE(empty.IsInitialized());

    auto result = empty.Unlock("anything");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::WrongPassphrase);
}

TEST_F(SignerTest, InitializeOnlyOnce) {
    EXPECT_TRUE(signer->IsInitialized());
    EXPECT_FALSE(signer->Initialize("other", TestSeed()));
}

// ============================================================================
// Sessions
// ============================================================================

TEST_F(SignerTest, GeneratedAddressMatchesDerivation) {
    auto unlocked = signer->Unlock("correct horse");
    ASSERT_TRUE(unlocked.success);

    auto generated = unlocked.session->GenerateAddress(0, 0, 2);
    ASSERT_TRUE(generated.success) << generated.message;

    auto seed = TestSeed();
    auto expected = Slip10Key::FromSeed(seed.data(), seed.size())
                        .DerivePath(DerivationPath::Bip44(0, 0, 2))
                        .GetAddress();
    ASSERT_TRUE(expected.has_value());
    EXPECT_EQ(generated.address, *expected);
    EXPECT_TRUE(signer->HasAddress(*expected));
    EXPECT_EQ(signer->GetAddresses().size(), 1u);
}

TEST_F(SignerTest, SignOncePerDistinctAddress) {
    auto unlocked = signer->Unlock("correct horse");
    ASSERT_TRUE(unlocked.success);
    SignerSession& session = *unlocked.session;

    Address a = session.GenerateAddress(0, 0, 0).address;
    Address b = session.GenerateAddress(0, 0, 1).address;

    auto result = session.Sign(TestMessage(), {a, b, a});
    ASSERT_TRUE(result.success) << result.message;
    ASSERT_EQ(result.signatures.size(), 2u);
    for (const auto& [address, signature] : result.signatures) {
        EXPECT_EQ(signature.GetAddress(), address);
        EXPECT_TRUE(signature.Verify(TestMessage()));
    }
}

TEST_F(SignerTest, UnknownAddressIsIncomplete) {
    auto unlocked = signer->Unlock("correct horse");
    ASSERT_TRUE(unlocked.success);
    Address known = unlocked.session->GenerateAddress(0, 0, 0).address;
    Address stranger = Address::Ed25519(Hash256::FromHex(std::string(64, '9')));

    auto result = unlocked.session->Sign(TestMessage(), {known, stranger});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::IncompleteSignatures);
    EXPECT_TRUE(result.signatures.empty());
}

TEST_F(SignerTest, ReleasedSessionIsLocked) {
    auto unlocked = signer->Unlock("correct horse");
    ASSERT_TRUE(unlocked.success);
    SignerSession& session = *unlocked.session;
    Address a = session.GenerateAddress(0, 0, 0).address;

    session.Release();
    session.Release();
    EXPECT_FALSE(session.IsActive());

    auto sign = session.Sign(TestMessage(), {a});
    EXPECT_EQ(sign.error, ErrorCode::SignerLocked);
    auto gen = session.GenerateAddress(0, 0, 1);
    EXPECT_EQ(gen.error, ErrorCode::SignerLocked);
}

TEST_F(SignerTest, MovedFromSessionIsLocked) {
    auto unlocked = signer->Unlock("correct horse");
    ASSERT_TRUE(unlocked.success);
    SignerSession moved = std::move(*unlocked.session);
    EXPECT_TRUE(moved.IsActive());
    EXPECT_FALSE(unlocked.session->IsActive());
    EXPECT_EQ(unlocked.session->Sign(TestMessage(), {}).error, ErrorCode::SignerLocked);
}

TEST_F(SignerTest, ConcurrentSignCallsAllSucceed) {
    auto unlocked = signer->Unlock("correct horse");
    ASSERT_TRUE(unlocked.success);
    SignerSession& session = *unlocked.session;
    Address a = session.GenerateAddress(0, 0, 0).address;

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 10; ++i) {
                if (session.Sign(TestMessage(), {a}).success) {
                    ++ok;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(ok.load(), 40);
}

// ============================================================================
// Passphrase Change and Persistence
// ============================================================================

TEST_F(SignerTest, ChangePassphrase) {
    EXPECT_EQ(signer->ChangePassphrase("wrong", "new"), ErrorCode::WrongPassphrase);
    EXPECT_EQ(signer->ChangePassphrase("correct horse", "new"), ErrorCode::None);

    EXPECT_EQ(signer->Unlock("correct horse").error, ErrorCode::WrongPassphrase);
    EXPECT_TRUE(signer->Unlock("new").success);
}

TEST_F(SignerTest, SnapshotHoldsNoPlaintextSeed) {
    auto stored = backend->Load();
    ASSERT_TRUE(stored.has_value());
    auto seed = TestSeed();
    auto it = std::search(stored->begin(), stored->end(), seed.begin(), seed.begin() + 16);
    EXPECT_TRUE(it == stored->end());

    auto snapshot = SecretSnapshot::Deserialize(*stored);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->kdfIterations, TEST_KDF_ITERATIONS);
}

TEST_F(SignerTest, ReloadedStoreKeepsRegistry) {
    Address a;
    {
        auto unlocked = signer->Unlock("correct horse");
        ASSERT_TRUE(unlocked.success);
        a = unlocked.session->GenerateAddress(0, 1, 0).address;
    }

    SecureSigner reloaded(backend, TEST_KDF_ITERATIONS);
    EXPECT_TRUE(reloaded.IsInitialized());
    EXPECT_TRUE(reloaded.HasAddress(a));

    auto unlocked = reloaded.Unlock("correct horse");
    ASSERT_TRUE(unlocked.success);
    EXPECT_TRUE(unlocked.session->Sign(TestMessage(), {a}).success);
}

class FileBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/stardust_signer_XXXXXX";
        int fd = mkstemp(tmpl);
        ASSERT_NE(fd, -1);
        close(fd);
        path = tmpl;
        std::remove(path.c_str());
    }

    void TearDown() override {
        std::remove(path.c_str());
    }

    std::string path;
};

TEST_F(FileBackendTest, MissingFileLoadsNothing) {
    FileSecretBackend backend(path);
    EXPECT_FALSE(backend.Load().has_value());
}

TEST_F(FileBackendTest, StoreIsOwnerOnly) {
    auto backend = std::make_shared<FileSecretBackend>(path);
    SecureSigner signer(backend, TEST_KDF_ITERATIONS);
    ASSERT_TRUE(signer.Initialize("pass", TestSeed()));

    struct stat st;
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    SecureSigner reopened(std::make_shared<FileSecretBackend>(path), TEST_KDF_ITERATIONS);
    EXPECT_TRUE(reopened.Unlock("pass").success);
}

TEST_F(FileBackendTest, CorruptSnapshotThrows) {
    FileSecretBackend backend(path);
    ASSERT_TRUE(backend.Store({0x01, 0x02, 0x03}));
    EXPECT_THROW(SecureSigner(std::make_shared<FileSecretBackend>(path), TEST_KDF_ITERATIONS),
                 std::runtime_error);
}

} // namespace test
} // namespace wallet
} // namespace stardust
