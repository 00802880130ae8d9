#include "verify/Verdict.hpp"
#include <cstdint>

using namespace tessera;

const char* tessera::to_reason(VerdictCode c) {
    switch (c) {
        case VerdictCode::ACCEPTED:              return "accepted";
        case VerdictCode::INCOMPLETE_SUBMISSION: return "incomplete_submission";
        case VerdictCode::MALFORMED_PAYLOAD:     return "malformed_payload";
        case VerdictCode::STALE_TIMESTAMP:       return "stale_timestamp";
        case VerdictCode::BAD_HASH:              return "bad_hash";
        case VerdictCode::UNKNOWN_MINER:         return "unknown_miner";
        case VerdictCode::BAD_SIGNATURE:         return "bad_signature";
        case VerdictCode::REPLAYED_NONCE:        return "replayed_nonce";
    }
    return "unknown";
}

nlohmann::json Verdict::to_json() const {
    nlohmann::json j;
    j["status"]  = accepted() ? "accepted" : "rejected";
    j["reason"]  = accepted() ? nlohmann::json(nullptr) : nlohmann::json(to_reason(code));
    j["code"]    = static_cast<int>(code);
    j["message"] = message;
    return j;
}

Verdict Verdict::from_json(const nlohmann::json& j) {
    Verdict v;
    v.code = VerdictCode::MALFORMED_PAYLOAD;
    if (!j.is_object()) {
        v.message = "unrecognised response";
        return v;
    }
    if (j.contains("message") && j["message"].is_string()) v.message = j["message"].get<std::string>();

    if (j.contains("code") && j["code"].is_number_integer()) {
        int64_t code = j["code"].get<int64_t>();
        if (code < 0 || code > static_cast<int64_t>(VerdictCode::REPLAYED_NONCE)) {
            v.message = "unknown verdict code " + std::to_string(code);
            return v;
        }
        v.code = static_cast<VerdictCode>(code);
        return v;
    }

    // Servers that only send status/reason.
    if (j.contains("status") && j["status"] == "accepted") {
        v.code = VerdictCode::ACCEPTED;
        return v;
    }
    if (j.contains("reason") && j["reason"].is_string()) {
        const std::string reason = j["reason"].get<std::string>();
        for (int c = 1; c <= static_cast<int>(VerdictCode::REPLAYED_NONCE); ++c) {
            if (reason == to_reason(static_cast<VerdictCode>(c))) {
                v.code = static_cast<VerdictCode>(c);
                return v;
            }
        }
        if (v.message.empty()) v.message = reason;
    }
    return v;
}
