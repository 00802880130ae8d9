#include "crypto/Ed25519Key.hpp"
#include "crypto/Hex.hpp"
#include "core/Errors.hpp"
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace tessera;

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Wipes a string holding key material when it goes out of scope, on every path.
struct SecretWipe {
    std::string& s;
    ~SecretWipe() {
        if (!s.empty()) OPENSSL_cleanse(&s[0], s.size());
    }
};

struct SeedWipe {
    std::vector<uint8_t>& v;
    ~SeedWipe() {
        if (!v.empty()) OPENSSL_cleanse(v.data(), v.size());
    }
};

static std::string raw_public_hex(EVP_PKEY* pkey) {
    uint8_t pub[IdentityKey::PUB_LEN];
    size_t  len = sizeof(pub);
    if (EVP_PKEY_get_raw_public_key(pkey, pub, &len) != 1 || len != sizeof(pub))
        throw std::runtime_error("[KEY] cannot extract public key");
    return hex_encode(pub, len);
}

// ---------------------------------------------------------------------------
// IdentityKey
// ---------------------------------------------------------------------------
IdentityKey::IdentityKey(EVP_PKEY* pkey) : pkey_(pkey) {
    public_hex_ = raw_public_hex(pkey_);
}

IdentityKey::IdentityKey(IdentityKey&& other) noexcept
    : pkey_(other.pkey_), public_hex_(std::move(other.public_hex_)) {
    other.pkey_ = nullptr;
}

IdentityKey::~IdentityKey() {
    if (pkey_) {
        EVP_PKEY_free(pkey_);
        pkey_ = nullptr;
    }
}

IdentityKey IdentityKey::from_seed_hex(const std::string& seed_hex) {
    std::string hex = trim(seed_hex);
    SecretWipe  wipe_hex{hex};
    if (hex.size() != SEED_LEN * 2)
        throw MalformedInput("[KEY] private key must be " +
                             std::to_string(SEED_LEN * 2) + " hex chars, got " +
                             std::to_string(hex.size()));

    std::vector<uint8_t> seed = hex_decode(hex, "private key");
    SeedWipe             wipe_seed{seed};
    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                  seed.data(), seed.size());
    if (!pkey) throw MalformedInput("[KEY] private key rejected by Ed25519");

    return IdentityKey(pkey);
}

IdentityKey IdentityKey::load(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0)
        throw IoError("[KEY] key file missing", path);
    if (st.st_mode & (S_IRWXG | S_IRWXO)) {
        std::cout << "[KEY] WARNING: " << path
                  << " is accessible by group/other, chmod 600 it\n";
    }

    std::ifstream f(path);
    if (!f.is_open()) throw IoError("[KEY] cannot open key file", path);
    std::stringstream ss;
    ss << f.rdbuf();
    if (f.bad()) throw IoError("[KEY] read failed", path);

    std::string contents = ss.str();
    SecretWipe  wipe_contents{contents};
    IdentityKey key = from_seed_hex(contents);
    std::cout << "[KEY] Identity loaded, public key " << key.public_key_hex() << "\n";
    return key;
}

IdentityKey IdentityKey::generate() {
    uint8_t seed[SEED_LEN];
    if (RAND_bytes(seed, sizeof(seed)) != 1)
        throw std::runtime_error("[KEY] RAND_bytes failed");
    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                  seed, sizeof(seed));
    OPENSSL_cleanse(seed, sizeof(seed));
    if (!pkey) throw std::runtime_error("[KEY] Ed25519 key construction failed");
    return IdentityKey(pkey);
}

void IdentityKey::save(const std::string& path) const {
    uint8_t seed[SEED_LEN];
    size_t  len = sizeof(seed);
    if (EVP_PKEY_get_raw_private_key(pkey_, seed, &len) != 1 || len != SEED_LEN)
        throw std::runtime_error("[KEY] cannot extract private key");

    std::string hex = hex_encode(seed, len) + "\n";
    OPENSSL_cleanse(seed, sizeof(seed));

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (fd < 0) {
        OPENSSL_cleanse(&hex[0], hex.size());
        throw IoError(std::string("[KEY] cannot create key file: ") + std::strerror(errno), path);
    }

    size_t off = 0;
    while (off < hex.size()) {
        ssize_t n = ::write(fd, hex.data() + off, hex.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        off += static_cast<size_t>(n);
    }
    OPENSSL_cleanse(&hex[0], hex.size());

    bool ok = (off == hex.size());
    if (::close(fd) != 0) ok = false;
    if (!ok) throw IoError("[KEY] short write on key file", path);
}

// ---------------------------------------------------------------------------
// VerifyKey
// ---------------------------------------------------------------------------
VerifyKey::VerifyKey(EVP_PKEY* pkey, std::string hex)
    : pkey_(pkey), hex_(std::move(hex)) {}

VerifyKey::VerifyKey(const VerifyKey& other) : pkey_(other.pkey_), hex_(other.hex_) {
    if (pkey_) EVP_PKEY_up_ref(pkey_);
}

VerifyKey& VerifyKey::operator=(const VerifyKey& other) {
    if (this == &other) return *this;
    if (other.pkey_) EVP_PKEY_up_ref(other.pkey_);
    if (pkey_) EVP_PKEY_free(pkey_);
    pkey_ = other.pkey_;
    hex_  = other.hex_;
    return *this;
}

VerifyKey::VerifyKey(VerifyKey&& other) noexcept
    : pkey_(other.pkey_), hex_(std::move(other.hex_)) {
    other.pkey_ = nullptr;
}

VerifyKey& VerifyKey::operator=(VerifyKey&& other) noexcept {
    if (this == &other) return *this;
    if (pkey_) EVP_PKEY_free(pkey_);
    pkey_ = other.pkey_;
    hex_  = std::move(other.hex_);
    other.pkey_ = nullptr;
    return *this;
}

VerifyKey::~VerifyKey() {
    if (pkey_) {
        EVP_PKEY_free(pkey_);
        pkey_ = nullptr;
    }
}

VerifyKey VerifyKey::from_hex(const std::string& pub_hex) {
    std::string hex = trim(pub_hex);
    if (hex.size() != IdentityKey::PUB_LEN * 2)
        throw MalformedInput("[KEY] public key must be " +
                             std::to_string(IdentityKey::PUB_LEN * 2) + " hex chars");

    std::vector<uint8_t> pub = hex_decode(hex, "public key");
    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                                 pub.data(), pub.size());
    if (!pkey) throw MalformedInput("[KEY] public key rejected by Ed25519");
    return VerifyKey(pkey, hex_encode(pub));
}

VerifyKey VerifyKey::from_identity(const IdentityKey& key) {
    return from_hex(key.public_key_hex());
}

bool VerifyKey::verify(const std::string& message, const uint8_t* sig, size_t sig_len) const {
    if (!pkey_ || sig_len != IdentityKey::SIG_LEN) return false;

    EVP_MD_CTX* md = EVP_MD_CTX_new();
    if (!md) return false;

    bool ok = EVP_DigestVerifyInit(md, nullptr, nullptr, nullptr, pkey_) == 1 &&
              EVP_DigestVerify(md, sig, sig_len,
                               reinterpret_cast<const unsigned char*>(message.data()),
                               message.size()) == 1;
    EVP_MD_CTX_free(md);
    return ok;
}
