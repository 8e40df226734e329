#pragma once

#include <rlcf/core/types.h>
#include <rlcf/weights/weight_schema.h>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rlcf::weights {

/**
 * Learned traversal weight for one (strategy, relation) key.
 */
struct TraversalWeight {
    double weight = 0.5;          // [0,1]
    double prior = 0.5;           // decay target
    TimePoint lastReinforced{};   // last feedback-driven change
    TimePoint lastDecayed{};      // last decay sweep applied
};

/**
 * Gating network parameters (theta_gating):
 *   h = ReLU(W1 x + b1), logits = W2 h + b2 + expertBias.
 * Matrices are row-major.
 */
struct GatingParameters {
    std::size_t inputDim = 0;
    std::size_t hidden = 0;
    std::vector<float> w1;         // hidden x inputDim
    std::vector<float> b1;         // hidden
    std::vector<float> w2;         // kStrategyCount x hidden
    std::vector<float> b2;         // kStrategyCount
    std::vector<float> expertBias; // kStrategyCount

    bool valid() const {
        return inputDim > 0 && hidden > 0 && w1.size() == hidden * inputDim &&
               b1.size() == hidden && w2.size() == kStrategyCount * hidden &&
               b2.size() == kStrategyCount && expertBias.size() == kStrategyCount;
    }

    bool operator==(const GatingParameters& o) const {
        return inputDim == o.inputDim && hidden == o.hidden && w1 == o.w1 && b1 == o.b1 &&
               w2 == o.w2 && b2 == o.b2 && expertBias == o.expertBias;
    }
};

// Rerank features: [gated hybrid score, vector score, gated graph score]
inline constexpr std::size_t kRerankFeatureCount = 3;

/**
 * Rerank parameters (theta_rerank): linear ordering score over candidate features.
 */
struct RerankParameters {
    std::array<double, kRerankFeatureCount> weights{1.0, 0.0, 0.0}; // each in [0,1]

    bool operator==(const RerankParameters& o) const { return weights == o.weights; }
};

std::string toJson(const GatingParameters& params);
Result<GatingParameters> gatingFromJson(std::string_view text);

std::string toJson(const RerankParameters& params);
Result<RerankParameters> rerankFromJson(std::string_view text);

} // namespace rlcf::weights
