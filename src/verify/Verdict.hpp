#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace tessera {

// Every submission ends in exactly one of these. There is no partial accept.
enum class VerdictCode : int {
    ACCEPTED              = 0,
    INCOMPLETE_SUBMISSION = 1,
    MALFORMED_PAYLOAD     = 2,
    STALE_TIMESTAMP       = 3,
    BAD_HASH              = 4,
    UNKNOWN_MINER         = 5,
    BAD_SIGNATURE         = 6,
    REPLAYED_NONCE        = 7,
};

const char* to_reason(VerdictCode c);

struct Verdict {
    VerdictCode code{VerdictCode::MALFORMED_PAYLOAD};
    std::string message;

    bool accepted() const { return code == VerdictCode::ACCEPTED; }

    // {"status":"accepted"|"rejected","reason":null|"...","code":N,"message":"..."}
    nlohmann::json to_json() const;

    // Client side. Accepts the full body or just status/reason; anything
    // unrecognised maps to MALFORMED_PAYLOAD.
    static Verdict from_json(const nlohmann::json& j);

    static Verdict accept(const std::string& msg) { return {VerdictCode::ACCEPTED, msg}; }
    static Verdict reject(VerdictCode c, const std::string& msg) { return {c, msg}; }
};

} // namespace tessera
