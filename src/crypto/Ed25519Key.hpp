#pragma once
#include <cstdint>
#include <string>
#include <openssl/evp.h>

namespace tessera {

// ---------------------------------------------------------------------------
// IdentityKey: the miner's Ed25519 signing key.
// Built once at startup and passed by reference to whoever signs. The seed is
// held only inside the EVP_PKEY; nothing here returns or prints it except
// save(), which writes it straight to an owner-only file.
// ---------------------------------------------------------------------------
class IdentityKey {
public:
    static constexpr size_t SEED_LEN = 32;
    static constexpr size_t PUB_LEN  = 32;
    static constexpr size_t SIG_LEN  = 64;

    // 64 hex chars (surrounding whitespace ignored). Throws MalformedInput.
    static IdentityKey from_seed_hex(const std::string& seed_hex);

    // Reads a hex seed file. Throws IoError if missing/unreadable.
    static IdentityKey load(const std::string& path);

    // Fresh random seed from the OpenSSL CSPRNG.
    static IdentityKey generate();

    IdentityKey(IdentityKey&& other) noexcept;
    IdentityKey& operator=(IdentityKey&&) = delete;
    IdentityKey(const IdentityKey&) = delete;
    IdentityKey& operator=(const IdentityKey&) = delete;
    ~IdentityKey();

    // Writes the hex seed to `path` with mode 0600. Refuses to overwrite an
    // existing file: losing an identity cannot be undone.
    void save(const std::string& path) const;

    std::string public_key_hex() const { return public_hex_; }

    EVP_PKEY* pkey() const { return pkey_; }

private:
    explicit IdentityKey(EVP_PKEY* pkey);

    EVP_PKEY*   pkey_{nullptr};
    std::string public_hex_;
};

// Public half, as bound to a miner id in the registry.
class VerifyKey {
public:
    // 64 hex chars. Throws MalformedInput.
    static VerifyKey from_hex(const std::string& pub_hex);
    static VerifyKey from_identity(const IdentityKey& key);

    VerifyKey(const VerifyKey& other);
    VerifyKey& operator=(const VerifyKey& other);
    VerifyKey(VerifyKey&& other) noexcept;
    VerifyKey& operator=(VerifyKey&& other) noexcept;
    ~VerifyKey();

    // False on any mismatch, including wrong signature length.
    bool verify(const std::string& message, const uint8_t* sig, size_t sig_len) const;

    const std::string& hex() const { return hex_; }

private:
    explicit VerifyKey(EVP_PKEY* pkey, std::string hex);

    EVP_PKEY*   pkey_{nullptr};
    std::string hex_;
};

} // namespace tessera
