#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace tessera {

// ---------------------------------------------------------------------------
// Claim: what the miner asserts about one training run.
// Field names below are the wire names. Once canonical_bytes() has been signed
// the claim must not change; any edit invalidates the signature.
// ---------------------------------------------------------------------------
struct Claim {
    std::string    task_id;
    int64_t        miner_id{0};
    double         performance{0.0};
    std::string    artifact_hash;                         // 64 lowercase hex
    nlohmann::json hyperparameters = nlohmann::json::object();
    uint64_t       timestamp{0};                          // unix seconds
    uint64_t       nonce{0};

    nlohmann::json to_json() const;

    // Canonical bytes (tessera-canon/1) of to_json(). Throws MalformedInput.
    std::string canonical_bytes() const;

    // Strict parse of a received payload object: every field present with the
    // right JSON type, artifact_hash well-formed. Throws MalformedInput.
    static Claim from_json(const nlohmann::json& j);
    static Claim parse(const std::string& payload_json);
};

uint64_t fresh_nonce();
uint64_t now_unix_seconds();

} // namespace tessera
