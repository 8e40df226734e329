#pragma once

#include <rlcf/core/types.h>
#include <rlcf/weights/parameters.h>
#include <rlcf/weights/weight_schema.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace rlcf::learning {

struct GatingConfig {
    std::size_t hidden = 16;   // hidden layer width
    double param_bound = 1.0;  // |theta| bound after every step
    std::uint64_t seed = 42;   // deterministic initialisation
    double init_scale = 0.1;   // uniform(-s, s) for weight matrices

    bool isValid() const { return hidden > 0 && param_bound > 0.0 && init_scale >= 0.0; }
};

using GateDistribution = std::array<double, weights::kStrategyCount>;

GateDistribution uniformDistribution();
bool isValidDistribution(const GateDistribution& d, double eps = 1e-9);

/**
 * Maps a query embedding to a probability distribution over strategies.
 *
 * Stateless over a parameter snapshot: forward() reads, step() returns a new
 * parameter set for the store to commit.
 */
class GatingNetwork {
public:
    explicit GatingNetwork(std::shared_ptr<const weights::GatingParameters> params);

    static weights::GatingParameters initialize(std::size_t inputDim, const GatingConfig& config);

    /**
     * Softmax over strategies with optional query-type modifiers.
     *
     * An all-zero or non-finite embedding returns the uniform distribution.
     * InvalidArgument on a dimension mismatch.
     */
    Result<GateDistribution> forward(const Embedding& x,
                                     weights::QueryType type = weights::QueryType::Unknown) const;

    /**
     * One gradient-ascent step: theta += clip(stepSize * d(objective)/d(theta), +-clip),
     * where dLogits is d(objective)/d(logits). Result is clamped to +-paramBound.
     */
    Result<weights::GatingParameters> step(const Embedding& x, const GateDistribution& dLogits,
                                           double stepSize, double clip,
                                           double paramBound) const;

    // d log pi(action) / d logits for a distribution produced by forward().
    static GateDistribution logProbGradient(const GateDistribution& probs, std::size_t action);

    std::size_t inputDim() const { return params_ ? params_->inputDim : 0; }

private:
    struct Activations {
        std::vector<double> pre;  // W1 x + b1
        std::vector<double> post; // ReLU(pre)
        GateDistribution logits{};
    };

    Activations activate(const Embedding& x) const;

    std::shared_ptr<const weights::GatingParameters> params_;
};

} // namespace rlcf::learning
