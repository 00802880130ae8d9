#include "submission/SubmissionAssembler.hpp"
#include "claim/CanonicalJson.hpp"
#include "crypto/Sha256Stream.hpp"
#include "core/Errors.hpp"
#include <iostream>

using namespace tessera;

SubmissionAssembler::SubmissionAssembler(const MinerAuth& auth) : auth_(auth) {}

Claim SubmissionAssembler::make_claim(const std::string& task_id,
                                      double performance,
                                      const nlohmann::json& hyperparameters,
                                      const std::string& artifact_hash) const {
    Claim c;
    c.task_id         = task_id;
    c.miner_id        = auth_.miner_id();
    c.performance     = performance;
    c.artifact_hash   = artifact_hash;
    c.hyperparameters = hyperparameters;
    c.timestamp       = now_unix_seconds();
    c.nonce           = fresh_nonce();
    return c;
}

WireSubmission SubmissionAssembler::assemble(const Claim& claim,
                                             const std::string& artifact_bytes,
                                             const std::string& filename,
                                             const std::string& media_type) const {
    if (claim.miner_id != auth_.miner_id())
        throw MalformedInput("[ASSEMBLE] claim miner_id " + std::to_string(claim.miner_id) +
                             " does not match signing identity " +
                             std::to_string(auth_.miner_id()));

    const std::string digest = Sha256Stream::hash_bytes(artifact_bytes);
    if (digest != claim.artifact_hash)
        throw MalformedInput("[ASSEMBLE] artifact_hash " + claim.artifact_hash +
                             " does not match artifact digest " + digest);

    const std::string canonical = claim.canonical_bytes();

    WireSubmission wire;
    wire.payload       = claim.to_json().dump();
    wire.signature     = auth_.sign(canonical);
    wire.canon_version = std::string(CANON_VERSION);
    wire.artifact      = ArtifactPart{filename, media_type, artifact_bytes};

    std::cout << "[ASSEMBLE] task=" << claim.task_id << " miner=" << claim.miner_id
              << " nonce=" << claim.nonce << " artifact=" << digest << "\n";
    return wire;
}
