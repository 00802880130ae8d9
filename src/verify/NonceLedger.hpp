#pragma once
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace tessera {

// ---------------------------------------------------------------------------
// NonceLedger: every (miner_id, nonce) pair that has been accepted.
// insert_if_absent() is the single atomic check-and-record step; two
// concurrent verifications of the same pair cannot both succeed.
//
// Entries remember the claim timestamp. Once a claim is older than the
// freshness window it is rejected as stale anyway, so prune() can forget it.
// ---------------------------------------------------------------------------
class NonceLedger {
public:
    explicit NonceLedger(uint64_t retention_sec);

    // true if the pair was new and is now recorded.
    bool insert_if_absent(int64_t miner_id, uint64_t nonce, uint64_t claim_ts);

    bool contains(int64_t miner_id, uint64_t nonce) const;

    // Drops entries with claim_ts + retention < now. Returns how many.
    size_t prune(uint64_t now);

    size_t size() const;

private:
    struct Key {
        int64_t  miner_id;
        uint64_t nonce;
        bool operator==(const Key& o) const { return miner_id == o.miner_id && nonce == o.nonce; }
    };
    struct KeyHash {
        size_t operator()(const Key& k) const {
            uint64_t x = static_cast<uint64_t>(k.miner_id) * 0x9e3779b97f4a7c15ull;
            x ^= k.nonce + 0x9e3779b97f4a7c15ull + (x << 6) + (x >> 2);
            return static_cast<size_t>(x);
        }
    };

    const uint64_t retention_sec_;
    mutable std::mutex mtx_;
    std::unordered_map<Key, uint64_t, KeyHash> seen_;
};

} // namespace tessera
