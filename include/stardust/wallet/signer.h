// STARDUST - Secure Signer
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Passphrase-gated secret store that produces Ed25519 signatures without
// ever handing out key material.
//
// The store persists an encrypted snapshot through an ISecretBackend:
// - 64-byte master seed, AES-256-GCM encrypted
// - key derived from the passphrase with PBKDF2-HMAC-SHA512
// - an encrypted verification token to detect wrong passphrases
// - the public registry of generated addresses and their derivation paths
//
// Signing happens only through a SignerSession obtained from Unlock().
// Releasing the session wipes the decrypted seed.

#ifndef STARDUST_WALLET_SIGNER_H
#define STARDUST_WALLET_SIGNER_H

#include "stardust/core/address.h"
#include "stardust/core/transaction.h"
#include "stardust/core/types.h"
#include "stardust/wallet/slip10.h"

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stardust {
namespace wallet {

// ============================================================================
// Constants
// ============================================================================

/// AES-256 key size
constexpr size_t AES_KEY_SIZE = 32;

/// AES-GCM nonce size
constexpr size_t AES_NONCE_SIZE = 12;

/// AES-GCM authentication tag size
constexpr size_t AES_TAG_SIZE = 16;

/// KDF salt size
constexpr size_t SALT_SIZE = 16;

/// PBKDF2-HMAC-SHA512 iterations used for new snapshots
constexpr uint32_t DEFAULT_KDF_ITERATIONS = 210000;

// ============================================================================
// Cryptographic Engine
// ============================================================================

/// Key derivation and authenticated encryption for the snapshot
class CryptoEngine {
public:
    /// PBKDF2-HMAC-SHA512. Throws std::runtime_error if OpenSSL fails.
    static void DeriveKey(const std::string& passphrase,
                          const std::array<Byte, SALT_SIZE>& salt,
                          uint32_t iterations,
                          Byte* keyOut);

    /// AES-256-GCM; returns ciphertext || tag
    static std::vector<Byte> Encrypt(const Byte* key,
                                     const std::array<Byte, AES_NONCE_SIZE>& nonce,
                                     const Byte* plaintext, size_t plaintextLen);

    /// Decrypt ciphertext || tag into `out` (exactly outLen bytes).
    /// False on authentication failure or length mismatch.
    static bool Decrypt(const Byte* key,
                        const std::array<Byte, AES_NONCE_SIZE>& nonce,
                        const std::vector<Byte>& ciphertext,
                        Byte* out, size_t outLen);

    static std::array<Byte, SALT_SIZE> GenerateSalt();
    static std::array<Byte, AES_NONCE_SIZE> GenerateNonce();

    /// Wipe memory (not optimized away)
    static void SecureZero(void* ptr, size_t size);

    /// Keep pages out of swap; best effort
    static bool LockMemory(void* ptr, size_t size);
    static bool UnlockMemory(void* ptr, size_t size);
};

/**
 * RAII container for sensitive data that:
 * - Locks memory to prevent swapping
 * - Securely zeros memory on destruction
 */
template<size_t N>
class SecureArray {
public:
    SecureArray() {
        data_.fill(0);
        CryptoEngine::LockMemory(data_.data(), N);
    }

    ~SecureArray() {
        CryptoEngine::SecureZero(data_.data(), N);
        CryptoEngine::UnlockMemory(data_.data(), N);
    }

    SecureArray(const SecureArray&) = delete;
    SecureArray& operator=(const SecureArray&) = delete;

    Byte* data() { return data_.data(); }
    const Byte* data() const { return data_.data(); }
    constexpr size_t size() const { return N; }

    void Wipe() { CryptoEngine::SecureZero(data_.data(), N); }

private:
    std::array<Byte, N> data_;
};

// ============================================================================
// Snapshot and Backends
// ============================================================================

/// A generated address and where it was derived
struct KeyRecord {
    Address address;
    uint32_t account{0};
    uint32_t change{0};
    uint32_t index{0};

    DerivationPath GetPath() const { return DerivationPath::Bip44(account, change, index); }

    bool operator==(const KeyRecord& o) const {
        return address == o.address && account == o.account &&
               change == o.change && index == o.index;
    }
};

/// Persisted form of the secret store. Contains no plaintext secrets.
struct SecretSnapshot {
    static constexpr uint32_t MAGIC = 0x53445354;  // "SDST"
    static constexpr uint32_t VERSION = 1;

    uint32_t kdfIterations{DEFAULT_KDF_ITERATIONS};
    std::array<Byte, SALT_SIZE> salt{};

    std::array<Byte, AES_NONCE_SIZE> tokenNonce{};
    std::vector<Byte> encryptedToken;

    std::array<Byte, AES_NONCE_SIZE> seedNonce{};
    std::vector<Byte> encryptedSeed;

    std::vector<KeyRecord> keys;

    std::vector<Byte> Serialize() const;
    static std::optional<SecretSnapshot> Deserialize(const std::vector<Byte>& data);
};

/// Persistent storage for the encrypted snapshot
class ISecretBackend {
public:
    virtual ~ISecretBackend() = default;

    /// Stored bytes, or nullopt if nothing has been stored
    virtual std::optional<std::vector<Byte>> Load() const = 0;

    virtual bool Store(const std::vector<Byte>& data) = 0;
};

class MemorySecretBackend : public ISecretBackend {
public:
    std::optional<std::vector<Byte>> Load() const override;
    bool Store(const std::vector<Byte>& data) override;

private:
    mutable std::mutex mutex_;
    std::optional<std::vector<Byte>> data_;
};

/// Snapshot file written with owner-only permissions (0600)
class FileSecretBackend : public ISecretBackend {
public:
    explicit FileSecretBackend(std::string path) : path_(std::move(path)) {}

    std::optional<std::vector<Byte>> Load() const override;
    bool Store(const std::vector<Byte>& data) override;

    const std::string& GetPath() const { return path_; }

private:
    std::string path_;
};

// ============================================================================
// Results
// ============================================================================

class SignerSession;

/// Signatures keyed by the address they unlock
struct SignResult {
    bool success{false};
    ErrorCode error{ErrorCode::None};
    std::string message;
    std::map<Address, Ed25519Signature> signatures;

    static SignResult Success(std::map<Address, Ed25519Signature> sigs) {
        SignResult r;
        r.success = true;
        r.signatures = std::move(sigs);
        return r;
    }

    static SignResult Failure(ErrorCode code, const std::string& msg) {
        SignResult r;
        r.error = code;
        r.message = msg;
        return r;
    }
};

struct AddressResult {
    bool success{false};
    ErrorCode error{ErrorCode::None};
    std::string message;
    Address address;

    static AddressResult Success(const Address& addr) {
        AddressResult r;
        r.success = true;
        r.address = addr;
        return r;
    }

    static AddressResult Failure(ErrorCode code, const std::string& msg) {
        AddressResult r;
        r.error = code;
        r.message = msg;
        return r;
    }
};

// ============================================================================
// Signer Session
// ============================================================================

class SecureSigner;

/**
 * Capability to sign, returned by SecureSigner::Unlock().
 *
 * Move-only. The session holds the decrypted seed until Release() or
 * destruction; afterwards every operation fails with SignerLocked.
 * Concurrent calls on one session are serialized. The signer that created
 * the session must outlive it.
 */
class SignerSession {
public:
    SignerSession(SignerSession&& other) noexcept = default;
    SignerSession& operator=(SignerSession&& other) noexcept;
    ~SignerSession();

    SignerSession(const SignerSession&) = delete;
    SignerSession& operator=(const SignerSession&) = delete;

    /// False after Release() or when moved from
    bool IsActive() const;

    /// Wipe the seed. Idempotent.
    void Release();

    /// Derive m/44'/4219'/account'/change'/index' and register its address
    AddressResult GenerateAddress(uint32_t account, uint32_t change, uint32_t index);

    /// Sign `essenceHash` once for every distinct address in `addresses`.
    /// Fails with IncompleteSignatures if an address is not in the store.
    SignResult Sign(const Hash256& essenceHash, const std::vector<Address>& addresses);

private:
    friend class SecureSigner;

    struct State {
        std::mutex mutex;
        SecureSigner* signer{nullptr};
        SecureArray<MASTER_SEED_SIZE> seed;
        bool active{false};
    };

    explicit SignerSession(std::unique_ptr<State> state) : state_(std::move(state)) {}

    std::unique_ptr<State> state_;
};

/// Outcome of SecureSigner::Unlock()
struct UnlockResult {
    bool success{false};
    ErrorCode error{ErrorCode::None};
    std::string message;
    std::optional<SignerSession> session;

    static UnlockResult Success(SignerSession s) {
        UnlockResult r;
        r.success = true;
        r.session.emplace(std::move(s));
        return r;
    }

    static UnlockResult Failure(ErrorCode code, const std::string& msg) {
        UnlockResult r;
        r.error = code;
        r.message = msg;
        return r;
    }
};

// ============================================================================
// Secure Signer
// ============================================================================

class SecureSigner {
public:
    explicit SecureSigner(std::shared_ptr<ISecretBackend> backend,
                          uint32_t kdfIterations = DEFAULT_KDF_ITERATIONS);

    SecureSigner(const SecureSigner&) = delete;
    SecureSigner& operator=(const SecureSigner&) = delete;

    bool IsInitialized() const;

    /// Encrypt and store `seed`. False if the store is already initialized.
    /// Throws std::runtime_error if the backend cannot persist.
    bool Initialize(const std::string& passphrase,
                    const std::array<Byte, MASTER_SEED_SIZE>& seed);

    /// Initialize with a seed from the system CSPRNG
    bool InitializeRandom(const std::string& passphrase);

    /// Session on success, WrongPassphrase otherwise (also when the store is
    /// not initialized; the same derivation work is done in both cases).
    UnlockResult Unlock(const std::string& passphrase);

    /// Re-encrypt under a new passphrase. Returns ErrorCode::None on success.
    ErrorCode ChangePassphrase(const std::string& oldPassphrase,
                               const std::string& newPassphrase);

    /// Addresses generated so far, in generation order
    std::vector<Address> GetAddresses() const;

    bool HasAddress(const Address& address) const;

private:
    friend class SignerSession;

    std::optional<KeyRecord> FindKey(const Address& address) const;

    /// Add to the registry and persist; no-op if already registered
    void RegisterKey(const KeyRecord& record);

    /// Encrypt `seed` under `passphrase` into `snapshot`
    void Seal(const std::string& passphrase, const Byte* seed, SecretSnapshot& snapshot) const;

    /// Verify passphrase against `snapshot` and decrypt its seed into `seedOut`
    static bool Open(const std::string& passphrase, const SecretSnapshot& snapshot,
                     Byte* seedOut);

    void Persist() const;

    std::shared_ptr<ISecretBackend> backend_;
    uint32_t kdfIterations_;

    mutable std::mutex mutex_;
    std::optional<SecretSnapshot> snapshot_;

    /// Decoy used by Unlock() while the store is uninitialized
    SecretSnapshot dummy_;
};

} // namespace wallet
} // namespace stardust

#endif // STARDUST_WALLET_SIGNER_H
