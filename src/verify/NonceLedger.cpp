#include "verify/NonceLedger.hpp"

using namespace tessera;

NonceLedger::NonceLedger(uint64_t retention_sec) : retention_sec_(retention_sec) {}

bool NonceLedger::insert_if_absent(int64_t miner_id, uint64_t nonce, uint64_t claim_ts) {
    std::lock_guard<std::mutex> lk(mtx_);
    return seen_.emplace(Key{miner_id, nonce}, claim_ts).second;
}

bool NonceLedger::contains(int64_t miner_id, uint64_t nonce) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return seen_.count(Key{miner_id, nonce}) != 0;
}

size_t NonceLedger::prune(uint64_t now) {
    std::lock_guard<std::mutex> lk(mtx_);
    size_t dropped = 0;
    for (auto it = seen_.begin(); it != seen_.end();) {
        if (it->second + retention_sec_ < now) {
            it = seen_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

size_t NonceLedger::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return seen_.size();
}
