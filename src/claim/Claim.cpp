#include "claim/Claim.hpp"
#include "claim/CanonicalJson.hpp"
#include "crypto/Hex.hpp"
#include "crypto/Sha256Stream.hpp"
#include "core/Errors.hpp"
#include <openssl/rand.h>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace tessera;
using json = nlohmann::json;

json Claim::to_json() const {
    json j = json::object();
    j["task_id"]         = task_id;
    j["miner_id"]        = miner_id;
    j["performance"]     = performance;
    j["artifact_hash"]   = artifact_hash;
    j["hyperparameters"] = hyperparameters;
    j["timestamp"]       = timestamp;
    j["nonce"]           = nonce;
    return j;
}

std::string Claim::canonical_bytes() const {
    if (!hyperparameters.is_object())
        throw MalformedInput("[CLAIM] hyperparameters must be a JSON object");
    return canonical_json(to_json());
}

// --- field readers ---------------------------------------------------------
static const json& field(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end()) throw MalformedInput(std::string("[CLAIM] missing field ") + name);
    return *it;
}

static uint64_t read_u64(const json& j, const char* name) {
    const json& v = field(j, name);
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer() && v.get<int64_t>() >= 0)
        return static_cast<uint64_t>(v.get<int64_t>());
    throw MalformedInput(std::string("[CLAIM] ") + name + " must be a non-negative integer");
}

static int64_t read_i64(const json& j, const char* name) {
    const json& v = field(j, name);
    if (v.is_number_unsigned()) {
        uint64_t u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            throw MalformedInput(std::string("[CLAIM] ") + name + " out of range");
        return static_cast<int64_t>(u);
    }
    if (v.is_number_integer()) return v.get<int64_t>();
    throw MalformedInput(std::string("[CLAIM] ") + name + " must be an integer");
}

Claim Claim::from_json(const json& j) {
    if (!j.is_object()) throw MalformedInput("[CLAIM] payload is not a JSON object");

    Claim c;

    const json& task = field(j, "task_id");
    if (!task.is_string()) throw MalformedInput("[CLAIM] task_id must be a string");
    c.task_id = task.get<std::string>();

    c.miner_id = read_i64(j, "miner_id");

    const json& perf = field(j, "performance");
    if (!perf.is_number()) throw MalformedInput("[CLAIM] performance must be a number");
    c.performance = perf.get<double>();
    if (!std::isfinite(c.performance)) throw MalformedInput("[CLAIM] performance not finite");

    const json& hash = field(j, "artifact_hash");
    if (!hash.is_string() || !is_lower_hex(hash.get<std::string>(), Sha256Stream::HEX_LEN))
        throw MalformedInput("[CLAIM] artifact_hash must be 64 lowercase hex chars");
    c.artifact_hash = hash.get<std::string>();

    const json& hp = field(j, "hyperparameters");
    if (!hp.is_object()) throw MalformedInput("[CLAIM] hyperparameters must be an object");
    c.hyperparameters = hp;

    c.timestamp = read_u64(j, "timestamp");
    c.nonce     = read_u64(j, "nonce");
    return c;
}

Claim Claim::parse(const std::string& payload_json) {
    json j;
    try {
        j = json::parse(payload_json);
    } catch (const json::exception& e) {
        throw MalformedInput(std::string("[CLAIM] invalid payload json: ") + e.what());
    }
    return from_json(j);
}

// ---------------------------------------------------------------------------
uint64_t tessera::fresh_nonce() {
    unsigned char b[8];
    if (RAND_bytes(b, sizeof(b)) != 1)
        throw std::runtime_error("[CLAIM] RAND_bytes failed");
    uint64_t n = 0;
    for (unsigned char x : b) n = (n << 8) | x;   // big-endian
    return n;
}

uint64_t tessera::now_unix_seconds() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}
