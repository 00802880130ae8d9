#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "auth/MinerAuth.hpp"
#include "claim/Claim.hpp"
#include "submission/Multipart.hpp"

namespace tessera {

// hash -> claim -> sign -> wire unit. Single sequential pipeline per
// submission; nothing here touches the network.
class SubmissionAssembler {
public:
    explicit SubmissionAssembler(const MinerAuth& auth);

    // Fresh claim for this miner: timestamp now, random nonce.
    Claim make_claim(const std::string& task_id,
                     double performance,
                     const nlohmann::json& hyperparameters,
                     const std::string& artifact_hash) const;

    // Throws MalformedInput if the claim belongs to another miner or its
    // artifact_hash does not match artifact_bytes.
    WireSubmission assemble(const Claim& claim,
                            const std::string& artifact_bytes,
                            const std::string& filename,
                            const std::string& media_type) const;

private:
    const MinerAuth& auth_;
};

} // namespace tessera
