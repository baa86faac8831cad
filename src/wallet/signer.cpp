// STARDUST - Secure Signer Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/wallet/signer.h"
#include "stardust/core/random.h"
#include "stardust/core/serialize.h"
#include "stardust/util/logging.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>

namespace stardust {
namespace wallet {

namespace {

const char VERIFICATION_MAGIC[] = "STARDUST_SIGNER_V1";
constexpr size_t VERIFICATION_MAGIC_SIZE = sizeof(VERIFICATION_MAGIC) - 1;

/// Upper bound for ciphertexts inside a snapshot
constexpr size_t MAX_SNAPSHOT_CIPHERTEXT = 1024;

/// Upper bound for registered keys inside a snapshot
constexpr uint32_t MAX_SNAPSHOT_KEYS = 1u << 20;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

} // namespace

// ============================================================================
// CryptoEngine
// ============================================================================

void CryptoEngine::DeriveKey(const std::string& passphrase,
                             const std::array<Byte, SALT_SIZE>& salt,
                             uint32_t iterations,
                             Byte* keyOut) {
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha512(),
                          static_cast<int>(AES_KEY_SIZE), keyOut) != 1) {
        throw std::runtime_error("PBKDF2 key derivation failed");
    }
}

std::vector<Byte> CryptoEngine::Encrypt(const Byte* key,
                                        const std::array<Byte, AES_NONCE_SIZE>& nonce,
                                        const Byte* plaintext, size_t plaintextLen) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    std::vector<Byte> ciphertext(plaintextLen + AES_TAG_SIZE);
    int len = 0;

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(AES_NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key, nonce.data()) != 1) {
        throw std::runtime_error("Failed to initialize AES-GCM");
    }

    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, plaintext,
                          static_cast<int>(plaintextLen)) != 1) {
        throw std::runtime_error("Failed to encrypt");
    }
    int total = len;

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
        throw std::runtime_error("Failed to finalize encryption");
    }
    total += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(AES_TAG_SIZE), ciphertext.data() + total) != 1) {
        throw std::runtime_error("Failed to get auth tag");
    }

    ciphertext.resize(static_cast<size_t>(total) + AES_TAG_SIZE);
    return ciphertext;
}

bool CryptoEngine::Decrypt(const Byte* key,
                           const std::array<Byte, AES_NONCE_SIZE>& nonce,
                           const std::vector<Byte>& ciphertext,
                           Byte* out, size_t outLen) {
    if (ciphertext.size() != outLen + AES_TAG_SIZE) {
        return false;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return false;
    }

    int len = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(AES_NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key, nonce.data()) != 1) {
        return false;
    }

    if (EVP_DecryptUpdate(ctx.get(), out, &len, ciphertext.data(),
                          static_cast<int>(outLen)) != 1) {
        SecureZero(out, outLen);
        return false;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(AES_TAG_SIZE),
                            const_cast<Byte*>(ciphertext.data() + outLen)) != 1) {
        SecureZero(out, outLen);
        return false;
    }

    // Tag verification
    if (EVP_DecryptFinal_ex(ctx.get(), out + len, &len) != 1) {
        SecureZero(out, outLen);
        return false;
    }
    return true;
}

std::array<Byte, SALT_SIZE> CryptoEngine::GenerateSalt() {
    std::array<Byte, SALT_SIZE> salt{};
    GetRandBytes(salt.data(), SALT_SIZE);
    return salt;
}

std::array<Byte, AES_NONCE_SIZE> CryptoEngine::GenerateNonce() {
    std::array<Byte, AES_NONCE_SIZE> nonce{};
    GetRandBytes(nonce.data(), AES_NONCE_SIZE);
    return nonce;
}

void CryptoEngine::SecureZero(void* ptr, size_t size) {
    OPENSSL_cleanse(ptr, size);
}

bool CryptoEngine::LockMemory(void* ptr, size_t size) {
    return mlock(ptr, size) == 0;
}

bool CryptoEngine::UnlockMemory(void* ptr, size_t size) {
    return munlock(ptr, size) == 0;
}

// ============================================================================
// SecretSnapshot
// ============================================================================

std::vector<Byte> SecretSnapshot::Serialize() const {
    DataStream s;
    ser_writedata32(s, MAGIC);
    ser_writedata32(s, VERSION);
    ser_writedata32(s, kdfIterations);
    s.Write(salt.data(), salt.size());
    s.Write(tokenNonce.data(), tokenNonce.size());
    WriteBytesPrefix16(s, encryptedToken);
    s.Write(seedNonce.data(), seedNonce.size());
    WriteBytesPrefix16(s, encryptedSeed);

    ser_writedata32(s, static_cast<uint32_t>(keys.size()));
    for (const auto& key : keys) {
        stardust::Serialize(s, key.address);
        ser_writedata32(s, key.account);
        ser_writedata32(s, key.change);
        ser_writedata32(s, key.index);
    }
    return s.Data();
}

std::optional<SecretSnapshot> SecretSnapshot::Deserialize(const std::vector<Byte>& data) {
    try {
        DataStream s(data);
        if (ser_readdata32(s) != MAGIC || ser_readdata32(s) != VERSION) {
            return std::nullopt;
        }

        SecretSnapshot snapshot;
        snapshot.kdfIterations = ser_readdata32(s);
        if (snapshot.kdfIterations == 0) {
            return std::nullopt;
        }
        s.Read(snapshot.salt.data(), snapshot.salt.size());
        s.Read(snapshot.tokenNonce.data(), snapshot.tokenNonce.size());
        snapshot.encryptedToken = ReadBytesPrefix16(s, MAX_SNAPSHOT_CIPHERTEXT);
        s.Read(snapshot.seedNonce.data(), snapshot.seedNonce.size());
        snapshot.encryptedSeed = ReadBytesPrefix16(s, MAX_SNAPSHOT_CIPHERTEXT);

        uint32_t count = ser_readdata32(s);
        if (count > MAX_SNAPSHOT_KEYS) {
            return std::nullopt;
        }
        for (uint32_t i = 0; i < count; ++i) {
            KeyRecord record;
            stardust::Unserialize(s, record.address);
            record.account = ser_readdata32(s);
            record.change = ser_readdata32(s);
            record.index = ser_readdata32(s);
            snapshot.keys.push_back(record);
        }
        if (!s.empty()) {
            return std::nullopt;
        }
        return snapshot;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

// ============================================================================
// Backends
// ============================================================================

std::optional<std::vector<Byte>> MemorySecretBackend::Load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

bool MemorySecretBackend::Store(const std::vector<Byte>& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_ = data;
    return true;
}

std::optional<std::vector<Byte>> FileSecretBackend::Load() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return std::vector<Byte>((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
}

bool FileSecretBackend::Store(const std::vector<Byte>& data) {
    // Write a sibling file first so a crash never leaves a torn snapshot
    std::string tmpPath = path_ + ".tmp";
    int fd = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        return false;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t result = write(fd, data.data() + written, data.size() - written);
        if (result < 0) {
            close(fd);
            std::remove(tmpPath.c_str());
            return false;
        }
        written += static_cast<size_t>(result);
    }

    bool synced = fsync(fd) == 0;
    close(fd);
    if (!synced || std::rename(tmpPath.c_str(), path_.c_str()) != 0) {
        std::remove(tmpPath.c_str());
        return false;
    }
    return true;
}

// ============================================================================
// SignerSession
// ============================================================================

SignerSession& SignerSession::operator=(SignerSession&& other) noexcept {
    if (this != &other) {
        Release();
        state_ = std::move(other.state_);
    }
    return *this;
}

SignerSession::~SignerSession() {
    Release();
}

bool SignerSession::IsActive() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->active;
}

void SignerSession::Release() {
    if (!state_) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->active) {
        state_->seed.Wipe();
        state_->active = false;
        LOG_DEBUG(util::LogCategory::SIGNER) << "Signer session released";
    }
}

AddressResult SignerSession::GenerateAddress(uint32_t account, uint32_t change, uint32_t index) {
    if (!state_) {
        return AddressResult::Failure(ErrorCode::SignerLocked, "Session is not active");
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->active) {
        return AddressResult::Failure(ErrorCode::SignerLocked, "Session has been released");
    }
    if (account >= HARDENED_FLAG || change >= HARDENED_FLAG || index >= HARDENED_FLAG) {
        return AddressResult::Failure(ErrorCode::None, "Derivation index out of range");
    }

    KeyRecord record;
    record.account = account;
    record.change = change;
    record.index = index;

    auto key = Slip10Key::FromSeed(state_->seed.data(), state_->seed.size())
                   .DerivePath(record.GetPath());
    auto address = key.GetAddress();
    if (!address) {
        return AddressResult::Failure(ErrorCode::None, "Public key derivation failed");
    }
    record.address = *address;

    state_->signer->RegisterKey(record);
    LOG_DEBUG(util::LogCategory::SIGNER) << "Generated address at "
                                         << record.GetPath().ToString();
    return AddressResult::Success(record.address);
}

SignResult SignerSession::Sign(const Hash256& essenceHash, const std::vector<Address>& addresses) {
    if (!state_) {
        return SignResult::Failure(ErrorCode::SignerLocked, "Session is not active");
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->active) {
        return SignResult::Failure(ErrorCode::SignerLocked, "Session has been released");
    }

    std::set<Address> unique(addresses.begin(), addresses.end());

    // Resolve every address before producing any signature
    std::vector<KeyRecord> records;
    for (const auto& address : unique) {
        auto record = state_->signer->FindKey(address);
        if (!record) {
            return SignResult::Failure(ErrorCode::IncompleteSignatures,
                                       "No key for address " + address.ToHex());
        }
        records.push_back(*record);
    }

    auto master = Slip10Key::FromSeed(state_->seed.data(), state_->seed.size());
    std::map<Address, Ed25519Signature> signatures;
    for (const auto& record : records) {
        auto key = master.DerivePath(record.GetPath());
        auto pub = key.GetPublicKey();
        auto sig = key.Sign(essenceHash.data(), essenceHash.size());
        if (!pub || !sig || Address::FromPublicKey(*pub) != record.address) {
            return SignResult::Failure(ErrorCode::IncompleteSignatures,
                                       "Signing failed for " + record.address.ToHex());
        }
        Ed25519Signature signature;
        signature.publicKey = *pub;
        signature.signature = *sig;
        signatures.emplace(record.address, signature);
    }

    LOG_DEBUG(util::LogCategory::SIGNER) << "Produced " << signatures.size() << " signature(s)";
    return SignResult::Success(std::move(signatures));
}

// ============================================================================
// SecureSigner
// ============================================================================

SecureSigner::SecureSigner(std::shared_ptr<ISecretBackend> backend, uint32_t kdfIterations)
    : backend_(std::move(backend))
    , kdfIterations_(kdfIterations == 0 ? DEFAULT_KDF_ITERATIONS : kdfIterations) {
    if (!backend_) {
        throw std::invalid_argument("SecureSigner requires a backend");
    }

    auto stored = backend_->Load();
    if (stored) {
        snapshot_ = SecretSnapshot::Deserialize(*stored);
        if (!snapshot_) {
            throw std::runtime_error("Secret snapshot is corrupt");
        }
    }

    // Decoy with a random seed under a random passphrase. Unlock attempts
    // against an empty store run the same KDF and decryption on it.
    SecureArray<MASTER_SEED_SIZE> decoySeed;
    GetRandBytes(decoySeed.data(), decoySeed.size());
    std::array<Byte, 32> decoyPass{};
    GetRandBytes(decoyPass.data(), decoyPass.size());
    std::string passphrase(decoyPass.begin(), decoyPass.end());
    Seal(passphrase, decoySeed.data(), dummy_);
    CryptoEngine::SecureZero(&passphrase[0], passphrase.size());
}

bool SecureSigner::IsInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_.has_value();
}

void SecureSigner::Seal(const std::string& passphrase, const Byte* seed,
                        SecretSnapshot& snapshot) const {
    snapshot.kdfIterations = kdfIterations_;
    snapshot.salt = CryptoEngine::GenerateSalt();

    SecureArray<AES_KEY_SIZE> key;
    CryptoEngine::DeriveKey(passphrase, snapshot.salt, snapshot.kdfIterations, key.data());

    snapshot.tokenNonce = CryptoEngine::GenerateNonce();
    snapshot.encryptedToken = CryptoEngine::Encrypt(
        key.data(), snapshot.tokenNonce,
        reinterpret_cast<const Byte*>(VERIFICATION_MAGIC), VERIFICATION_MAGIC_SIZE);

    snapshot.seedNonce = CryptoEngine::GenerateNonce();
    snapshot.encryptedSeed = CryptoEngine::Encrypt(key.data(), snapshot.seedNonce,
                                                   seed, MASTER_SEED_SIZE);
}

bool SecureSigner::Open(const std::string& passphrase, const SecretSnapshot& snapshot,
                        Byte* seedOut) {
    SecureArray<AES_KEY_SIZE> key;
    CryptoEngine::DeriveKey(passphrase, snapshot.salt, snapshot.kdfIterations, key.data());

    std::array<Byte, VERIFICATION_MAGIC_SIZE> token{};
    bool tokenOk = CryptoEngine::Decrypt(key.data(), snapshot.tokenNonce,
                                         snapshot.encryptedToken,
                                         token.data(), token.size());
    tokenOk = tokenOk && CRYPTO_memcmp(token.data(), VERIFICATION_MAGIC,
                                       VERIFICATION_MAGIC_SIZE) == 0;
    if (!tokenOk) {
        return false;
    }
    return CryptoEngine::Decrypt(key.data(), snapshot.seedNonce, snapshot.encryptedSeed,
                                 seedOut, MASTER_SEED_SIZE);
}

void SecureSigner::Persist() const {
    if (!backend_->Store(snapshot_->Serialize())) {
        throw std::runtime_error("Failed to persist secret snapshot");
    }
}

bool SecureSigner::Initialize(const std::string& passphrase,
                              const std::array<Byte, MASTER_SEED_SIZE>& seed) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshot_) {
        return false;
    }

    SecretSnapshot snapshot;
    Seal(passphrase, seed.data(), snapshot);
    snapshot_ = std::move(snapshot);
    try {
        Persist();
    } catch (const std::runtime_error&) {
        snapshot_.reset();
        throw;
    }
    LOG_INFO(util::LogCategory::SIGNER) << "Secret store initialized";
    return true;
}

bool SecureSigner::InitializeRandom(const std::string& passphrase) {
    std::array<Byte, MASTER_SEED_SIZE> seed{};
    GetRandBytes(seed.data(), seed.size());
    bool ok = Initialize(passphrase, seed);
    CryptoEngine::SecureZero(seed.data(), seed.size());
    return ok;
}

UnlockResult SecureSigner::Unlock(const std::string& passphrase) {
    std::unique_ptr<SignerSession::State> state(new SignerSession::State());
    state->signer = this;

    std::optional<SecretSnapshot> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = snapshot_;
    }

    bool opened = Open(passphrase, snapshot ? *snapshot : dummy_, state->seed.data());
    if (!opened || !snapshot) {
        state->seed.Wipe();
        LOG_WARN(util::LogCategory::SIGNER) << "Unlock failed";
        return UnlockResult::Failure(ErrorCode::WrongPassphrase, "Wrong passphrase");
    }

    state->active = true;
    LOG_DEBUG(util::LogCategory::SIGNER) << "Signer unlocked";
    return UnlockResult::Success(SignerSession(std::move(state)));
}

ErrorCode SecureSigner::ChangePassphrase(const std::string& oldPassphrase,
                                         const std::string& newPassphrase) {
    std::lock_guard<std::mutex> lock(mutex_);
    SecureArray<MASTER_SEED_SIZE> seed;
    if (!Open(oldPassphrase, snapshot_ ? *snapshot_ : dummy_, seed.data()) || !snapshot_) {
        return ErrorCode::WrongPassphrase;
    }

    SecretSnapshot updated = *snapshot_;
    Seal(newPassphrase, seed.data(), updated);

    SecretSnapshot previous = *snapshot_;
    snapshot_ = std::move(updated);
    try {
        Persist();
    } catch (const std::runtime_error&) {
        snapshot_ = std::move(previous);
        throw;
    }
    LOG_INFO(util::LogCategory::SIGNER) << "Passphrase changed";
    return ErrorCode::None;
}

std::vector<Address> SecureSigner::GetAddresses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Address> result;
    if (snapshot_) {
        for (const auto& key : snapshot_->keys) {
            result.push_back(key.address);
        }
    }
    return result;
}

bool SecureSigner::HasAddress(const Address& address) const {
    return FindKey(address).has_value();
}

std::optional<KeyRecord> SecureSigner::FindKey(const Address& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!snapshot_) {
        return std::nullopt;
    }
    for (const auto& key : snapshot_->keys) {
        if (key.address == address) {
            return key;
        }
    }
    return std::nullopt;
}

void SecureSigner::RegisterKey(const KeyRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!snapshot_) {
        throw std::logic_error("Registering a key on an uninitialized store");
    }
    for (const auto& key : snapshot_->keys) {
        if (key.address == record.address) {
            return;
        }
    }
    snapshot_->keys.push_back(record);
    try {
        Persist();
    } catch (const std::runtime_error&) {
        snapshot_->keys.pop_back();
        throw;
    }
}

} // namespace wallet
} // namespace stardust
