#pragma once
#include <cstdint>
#include <istream>
#include <string>
#include <openssl/evp.h>

namespace tessera {

// Incremental SHA-256. Feed any number of chunks, then take the digest once.
class Sha256Stream {
public:
    static constexpr size_t DIGEST_LEN     = 32;
    static constexpr size_t HEX_LEN        = 64;
    static constexpr size_t DEFAULT_CHUNK  = 8192;

    Sha256Stream();
    ~Sha256Stream();

    Sha256Stream(const Sha256Stream&) = delete;
    Sha256Stream& operator=(const Sha256Stream&) = delete;

    void update(const void* data, size_t len);
    void update(const std::string& bytes) { update(bytes.data(), bytes.size()); }

    // Finalizes the context. Calling update() afterwards throws.
    std::string hex_digest();

    static std::string hash_bytes(const std::string& bytes);

    // Bounded-memory read of the whole stream. Throws IoError (with `label`
    // as the path) if the stream fails before EOF.
    static std::string hash_stream(std::istream& in,
                                   const std::string& label,
                                   size_t chunk_size = DEFAULT_CHUNK);

    static std::string hash_file(const std::string& path,
                                 size_t chunk_size = DEFAULT_CHUNK);

private:
    EVP_MD_CTX* ctx_{nullptr};
    bool        finalized_{false};
};

} // namespace tessera
