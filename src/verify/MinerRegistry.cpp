#include "verify/MinerRegistry.hpp"
#include "core/Errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

using namespace tessera;

void MinerRegistry::bind(int64_t miner_id, const std::string& public_key_hex) {
    VerifyKey key = VerifyKey::from_hex(public_key_hex);
    std::unique_lock<std::shared_mutex> lk(mtx_);
    keys_.erase(miner_id);
    keys_.emplace(miner_id, std::move(key));
}

std::optional<VerifyKey> MinerRegistry::lookup(int64_t miner_id) const {
    std::shared_lock<std::shared_mutex> lk(mtx_);
    auto it = keys_.find(miner_id);
    if (it == keys_.end()) return std::nullopt;
    return it->second;
}

size_t MinerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lk(mtx_);
    return keys_.size();
}

void MinerRegistry::load_file(MinerRegistry& into, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw IoError("[REGISTRY] cannot open registry", path);

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        throw MalformedInput(std::string("[REGISTRY] invalid json in ") + path + ": " + e.what());
    }
    if (!j.is_object()) throw MalformedInput("[REGISTRY] registry must be a JSON object: " + path);

    for (auto it = j.begin(); it != j.end(); ++it) {
        int64_t id;
        try {
            size_t used = 0;
            id = std::stoll(it.key(), &used);
            if (used != it.key().size()) throw std::invalid_argument(it.key());
        } catch (const std::exception&) {
            throw MalformedInput("[REGISTRY] miner id is not an integer: " + it.key());
        }
        if (!it.value().is_string())
            throw MalformedInput("[REGISTRY] public key for miner " + it.key() + " is not a string");
        into.bind(id, it.value().get<std::string>());
    }
    std::cout << "[REGISTRY] Loaded " << j.size() << " miner keys from " << path << "\n";
}
