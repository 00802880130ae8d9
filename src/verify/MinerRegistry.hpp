#pragma once
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "crypto/Ed25519Key.hpp"

namespace tessera {

// miner_id -> public key, bound out of band. Read-mostly; lookups from
// concurrent verifications share the lock.
class MinerRegistry {
public:
    // Replaces any previous binding. Throws MalformedInput on a bad key.
    void bind(int64_t miner_id, const std::string& public_key_hex);

    std::optional<VerifyKey> lookup(int64_t miner_id) const;

    size_t size() const;

    // {"<miner_id>": "<64 hex>", ...}. Throws IoError / MalformedInput.
    static void load_file(MinerRegistry& into, const std::string& path);

private:
    mutable std::shared_mutex mtx_;
    std::unordered_map<int64_t, VerifyKey> keys_;
};

} // namespace tessera
