#include "training/ReferenceTrainer.hpp"
#include "core/Errors.hpp"
#include <cmath>
#include <iostream>

using namespace tessera;

double ReferenceTrainer::score(const nlohmann::json& hyperparameters) {
    double lr = 0.0;
    if (hyperparameters.is_object() && hyperparameters.contains("lr")) {
        const auto& v = hyperparameters["lr"];
        if (!v.is_number()) throw MalformedInput("[TRAIN] lr must be a number");
        lr = v.get<double>();
    }

    double performance = 0.9 + (lr - 0.001) * 10.0;
    performance = std::round(performance * 1e5) / 1e5;
    std::cout << "[TRAIN] lr=" << lr << " performance=" << performance << "\n";
    return performance;
}
