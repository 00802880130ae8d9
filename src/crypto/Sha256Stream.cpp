#include "crypto/Sha256Stream.hpp"
#include "crypto/Hex.hpp"
#include "core/Errors.hpp"
#include <fstream>
#include <stdexcept>
#include <vector>

using namespace tessera;

Sha256Stream::Sha256Stream() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("[HASH] EVP_DigestInit_ex failed");
    }
}

Sha256Stream::~Sha256Stream() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
    }
}

void Sha256Stream::update(const void* data, size_t len) {
    if (finalized_) throw std::logic_error("[HASH] update after finalize");
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1)
        throw std::runtime_error("[HASH] EVP_DigestUpdate failed");
}

std::string Sha256Stream::hex_digest() {
    if (finalized_) throw std::logic_error("[HASH] digest already taken");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int  digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &digest_len) != 1 || digest_len != DIGEST_LEN)
        throw std::runtime_error("[HASH] EVP_DigestFinal_ex failed");
    finalized_ = true;
    return hex_encode(digest, digest_len);
}

std::string Sha256Stream::hash_bytes(const std::string& bytes) {
    Sha256Stream h;
    h.update(bytes);
    return h.hex_digest();
}

std::string Sha256Stream::hash_stream(std::istream& in,
                                      const std::string& label,
                                      size_t chunk_size) {
    if (chunk_size == 0) chunk_size = DEFAULT_CHUNK;

    Sha256Stream h;
    std::vector<char> buf(chunk_size);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (got > 0) h.update(buf.data(), static_cast<size_t>(got));
    }
    // Short read at EOF sets failbit too; anything else is a real read error.
    if (in.bad() || !in.eof())
        throw IoError("[HASH] read failed before end of artifact", label);

    return h.hex_digest();
}

std::string Sha256Stream::hash_file(const std::string& path, size_t chunk_size) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) throw IoError("[HASH] cannot open artifact", path);
    return hash_stream(f, path, chunk_size);
}
