#pragma once
#include <stdexcept>
#include <string>
#include <openssl/evp.h>
#include "crypto/Ed25519Key.hpp"
#include "crypto/Hex.hpp"
#include "core/Errors.hpp"

namespace tessera {

// Signs canonical claim bytes with the miner's identity key.
// Ed25519 is deterministic: the same bytes and key always give the same
// signature. Returns 128 lowercase hex chars.
class MinerAuth {
public:
    MinerAuth(long long miner_id, const IdentityKey& key)
        : miner_id_(miner_id), key_(key) {}

    // THREAD-SAFE: per-call EVP_MD_CTX, key is only read.
    std::string sign(const std::string& canonical) const {
        if (canonical.empty())
            throw MalformedInput("[AUTH] refusing to sign empty canonical bytes");

        EVP_MD_CTX* md = EVP_MD_CTX_new();
        if (!md) throw std::runtime_error("[AUTH] EVP_MD_CTX_new failed");

        unsigned char sig[IdentityKey::SIG_LEN];
        size_t        sig_len = sizeof(sig);
        bool ok = EVP_DigestSignInit(md, nullptr, nullptr, nullptr, key_.pkey()) == 1 &&
                  EVP_DigestSign(md, sig, &sig_len,
                                 reinterpret_cast<const unsigned char*>(canonical.data()),
                                 canonical.size()) == 1;
        EVP_MD_CTX_free(md);

        if (!ok || sig_len != IdentityKey::SIG_LEN)
            throw std::runtime_error("[AUTH] Ed25519 signing failed");
        return hex_encode(sig, sig_len);
    }

    long long          miner_id() const       { return miner_id_; }
    std::string        public_key_hex() const { return key_.public_key_hex(); }

private:
    long long          miner_id_;
    const IdentityKey& key_;
};

} // namespace tessera
