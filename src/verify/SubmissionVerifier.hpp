#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include "claim/Claim.hpp"
#include "crypto/Ed25519Key.hpp"
#include "submission/Multipart.hpp"
#include "verify/MinerRegistry.hpp"
#include "verify/NonceLedger.hpp"
#include "verify/Verdict.hpp"

namespace tessera {

struct FreshnessWindow {
    uint64_t max_age_sec{300};         // how old a claim may be
    uint64_t max_future_skew_sec{60};  // how far ahead of our clock
};

// ---------------------------------------------------------------------------
// SubmissionVerifier: the dual of the assembler.
//
// Order of checks (first failure decides):
//   parts present -> claim/signature well-formed -> fresh -> artifact digest
//   -> miner known -> signature over recomputed canonical bytes -> nonce new
//
// The nonce is recorded only after the submission authenticated, so a forger
// cannot burn someone else's nonces. Safe to share across threads.
// ---------------------------------------------------------------------------
class SubmissionVerifier {
public:
    using Clock = std::function<uint64_t()>;

    SubmissionVerifier(const MinerRegistry& registry,
                       NonceLedger& ledger,
                       FreshnessWindow window,
                       Clock clock = now_unix_seconds);

    Verdict verify(const WireSubmission& wire);

    // Raw multipart body as received; decode failures are rejections.
    Verdict verify_body(const std::string& body, const std::string& content_type);

    bool is_fresh(uint64_t claim_ts, uint64_t now) const;

    // Canonical bytes are rebuilt from the parsed claim, never taken from the
    // payload text as sent.
    static bool signature_valid(const Claim& claim,
                                const std::string& signature_hex,
                                const VerifyKey& key);

private:
    static constexpr uint64_t PRUNE_EVERY = 1024;

    const MinerRegistry&  registry_;
    NonceLedger&          ledger_;
    FreshnessWindow       window_;
    Clock                 clock_;
    std::atomic<uint64_t> accepted_{0};
};

} // namespace tessera
