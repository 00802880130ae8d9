#include "verify/SubmissionVerifier.hpp"
#include "claim/CanonicalJson.hpp"
#include "crypto/Hex.hpp"
#include "crypto/Sha256Stream.hpp"
#include "core/Errors.hpp"
#include <iostream>
#include <vector>

using namespace tessera;

static Verdict rejected(VerdictCode code, const std::string& msg) {
    std::cout << "[VERIFY] REJECTED " << to_reason(code) << ": " << msg << "\n";
    return Verdict::reject(code, msg);
}

SubmissionVerifier::SubmissionVerifier(const MinerRegistry& registry,
                                       NonceLedger& ledger,
                                       FreshnessWindow window,
                                       Clock clock)
    : registry_(registry), ledger_(ledger), window_(window), clock_(std::move(clock)) {}

bool SubmissionVerifier::is_fresh(uint64_t claim_ts, uint64_t now) const {
    if (claim_ts > now) return claim_ts - now <= window_.max_future_skew_sec;
    return now - claim_ts <= window_.max_age_sec;
}

bool SubmissionVerifier::signature_valid(const Claim& claim,
                                         const std::string& signature_hex,
                                         const VerifyKey& key) {
    if (signature_hex.size() != IdentityKey::SIG_LEN * 2) return false;

    std::vector<uint8_t> sig;
    std::string canonical;
    try {
        sig       = hex_decode(signature_hex, "signature");
        canonical = claim.canonical_bytes();
    } catch (const MalformedInput&) {
        return false;
    }
    return key.verify(canonical, sig.data(), sig.size());
}

Verdict SubmissionVerifier::verify(const WireSubmission& wire) {
    if (!wire.complete()) {
        std::string missing;
        if (!wire.payload)   missing += " payload";
        if (!wire.signature) missing += " signature";
        if (!wire.artifact)  missing += " artifact";
        return rejected(VerdictCode::INCOMPLETE_SUBMISSION, "missing parts:" + missing);
    }

    if (wire.canon_version && *wire.canon_version != CANON_VERSION)
        return rejected(VerdictCode::MALFORMED_PAYLOAD,
                        "unsupported canonical format " + *wire.canon_version);

    Claim claim;
    try {
        claim = Claim::parse(*wire.payload);
    } catch (const MalformedInput& e) {
        return rejected(VerdictCode::MALFORMED_PAYLOAD, e.what());
    }

    const std::string& sig_hex = *wire.signature;
    if (sig_hex.size() != IdentityKey::SIG_LEN * 2) {
        return rejected(VerdictCode::MALFORMED_PAYLOAD,
                        "signature must be " + std::to_string(IdentityKey::SIG_LEN * 2) + " hex chars");
    }
    try {
        hex_decode(sig_hex, "signature");
        claim.canonical_bytes();
    } catch (const MalformedInput& e) {
        return rejected(VerdictCode::MALFORMED_PAYLOAD, e.what());
    }

    const uint64_t now = clock_();
    if (!is_fresh(claim.timestamp, now)) {
        return rejected(VerdictCode::STALE_TIMESTAMP,
                        "timestamp " + std::to_string(claim.timestamp) +
                        " outside window at " + std::to_string(now));
    }

    const std::string digest = Sha256Stream::hash_bytes(wire.artifact->bytes);
    if (digest != claim.artifact_hash) {
        return rejected(VerdictCode::BAD_HASH,
                        "artifact digest " + digest + " != claimed " + claim.artifact_hash);
    }

    auto key = registry_.lookup(claim.miner_id);
    if (!key)
        return rejected(VerdictCode::UNKNOWN_MINER, "no public key for miner " + std::to_string(claim.miner_id));

    if (!signature_valid(claim, sig_hex, *key))
        return rejected(VerdictCode::BAD_SIGNATURE,
                        "signature does not verify for miner " + std::to_string(claim.miner_id));

    if (!ledger_.insert_if_absent(claim.miner_id, claim.nonce, claim.timestamp)) {
        return rejected(VerdictCode::REPLAYED_NONCE,
                        "nonce " + std::to_string(claim.nonce) + " already used by miner " +
                        std::to_string(claim.miner_id));
    }

    if (++accepted_ % PRUNE_EVERY == 0) ledger_.prune(now);

    std::cout << "[VERIFY] ACCEPTED task=" << claim.task_id << " miner=" << claim.miner_id
              << " performance=" << claim.performance << " artifact=" << digest << "\n";
    return Verdict::accept("submission accepted for task " + claim.task_id);
}

Verdict SubmissionVerifier::verify_body(const std::string& body, const std::string& content_type) {
    WireSubmission wire;
    try {
        wire = decode_multipart(body, content_type);
    } catch (const MalformedInput& e) {
        return rejected(VerdictCode::MALFORMED_PAYLOAD, e.what());
    }
    return verify(wire);
}
