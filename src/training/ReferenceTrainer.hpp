#pragma once
#include <nlohmann/json.hpp>

namespace tessera {

// Deterministic stand-in for the training black box. The training template
// shipped in every artifact computes the same score, so an evaluator re-running
// the package reproduces the claimed performance exactly.
class ReferenceTrainer {
public:
    // 0.9 + (lr - 0.001) * 10, lr defaulting to 0.0, rounded to 5 decimals.
    // Throws MalformedInput if "lr" is present but not a number.
    static double score(const nlohmann::json& hyperparameters);
};

} // namespace tessera
