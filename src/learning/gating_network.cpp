#include <rlcf/learning/gating_network.h>

#include <algorithm>
#include <cmath>
#include <random>

namespace rlcf::learning {

using weights::GatingParameters;
using weights::kStrategyCount;

GateDistribution uniformDistribution() {
    GateDistribution d;
    d.fill(1.0 / static_cast<double>(kStrategyCount));
    return d;
}

bool isValidDistribution(const GateDistribution& d, double eps) {
    double sum = 0.0;
    for (double p : d) {
        if (!std::isfinite(p) || p < 0.0)
            return false;
        sum += p;
    }
    return std::abs(sum - 1.0) <= eps;
}

namespace {

bool degenerate(const Embedding& x) {
    bool anyNonZero = false;
    for (float v : x) {
        if (!std::isfinite(v))
            return true;
        if (v != 0.0f)
            anyNonZero = true;
    }
    return !anyNonZero;
}

float clipStep(double v, double clip) {
    if (!std::isfinite(v))
        return 0.0f;
    return static_cast<float>(std::clamp(v, -clip, clip));
}

float bounded(float v, double bound) {
    const auto b = static_cast<float>(bound);
    return std::clamp(v, -b, b);
}

} // namespace

GatingNetwork::GatingNetwork(std::shared_ptr<const GatingParameters> params)
    : params_(std::move(params)) {}

GatingParameters GatingNetwork::initialize(std::size_t inputDim, const GatingConfig& config) {
    GatingParameters p;
    p.inputDim = inputDim;
    p.hidden = config.hidden;

    std::mt19937_64 rng(config.seed);
    std::uniform_real_distribution<double> dist(-config.init_scale, config.init_scale);
    p.w1.resize(p.hidden * inputDim);
    for (auto& v : p.w1)
        v = static_cast<float>(dist(rng));
    p.b1.assign(p.hidden, 0.0f);
    p.w2.resize(kStrategyCount * p.hidden);
    for (auto& v : p.w2)
        v = static_cast<float>(dist(rng));
    p.b2.assign(kStrategyCount, 0.0f);
    p.expertBias.assign(kStrategyCount, 0.0f);
    return p;
}

GatingNetwork::Activations GatingNetwork::activate(const Embedding& x) const {
    const auto& p = *params_;
    Activations a;
    a.pre.assign(p.hidden, 0.0);
    a.post.assign(p.hidden, 0.0);
    for (std::size_t j = 0; j < p.hidden; ++j) {
        double z = p.b1[j];
        const float* row = p.w1.data() + j * p.inputDim;
        for (std::size_t i = 0; i < p.inputDim; ++i)
            z += static_cast<double>(row[i]) * x[i];
        a.pre[j] = z;
        a.post[j] = z > 0.0 ? z : 0.0;
    }
    for (std::size_t k = 0; k < kStrategyCount; ++k) {
        double l = static_cast<double>(p.b2[k]) + p.expertBias[k];
        const float* row = p.w2.data() + k * p.hidden;
        for (std::size_t j = 0; j < p.hidden; ++j)
            l += static_cast<double>(row[j]) * a.post[j];
        a.logits[k] = l;
    }
    return a;
}

Result<GateDistribution> GatingNetwork::forward(const Embedding& x, weights::QueryType type) const {
    if (!params_ || !params_->valid())
        return Error{ErrorCode::NotInitialized, "gating parameters are not initialised"};
    if (x.size() != params_->inputDim)
        return Error{ErrorCode::InvalidArgument,
                     "query embedding dimension " + std::to_string(x.size()) +
                         " != gating input dimension " + std::to_string(params_->inputDim)};
    if (degenerate(x))
        return uniformDistribution();

    auto act = activate(x);
    const double maxLogit = *std::max_element(act.logits.begin(), act.logits.end());
    GateDistribution probs{};
    double sum = 0.0;
    for (std::size_t k = 0; k < kStrategyCount; ++k) {
        probs[k] = std::exp(act.logits[k] - maxLogit);
        sum += probs[k];
    }
    if (!(sum > 0.0) || !std::isfinite(sum))
        return uniformDistribution();

    const auto mods = weights::queryTypeModifiers(type);
    double modSum = 0.0;
    for (std::size_t k = 0; k < kStrategyCount; ++k) {
        probs[k] = (probs[k] / sum) * mods[k];
        modSum += probs[k];
    }
    if (!(modSum > 0.0))
        return uniformDistribution();
    for (auto& pk : probs)
        pk /= modSum;
    return probs;
}

GateDistribution GatingNetwork::logProbGradient(const GateDistribution& probs,
                                                std::size_t action) {
    GateDistribution g{};
    for (std::size_t k = 0; k < kStrategyCount; ++k)
        g[k] = (k == action ? 1.0 : 0.0) - probs[k];
    return g;
}

Result<GatingParameters> GatingNetwork::step(const Embedding& x, const GateDistribution& dLogits,
                                             double stepSize, double clip,
                                             double paramBound) const {
    if (!params_ || !params_->valid())
        return Error{ErrorCode::NotInitialized, "gating parameters are not initialised"};
    if (x.size() != params_->inputDim)
        return Error{ErrorCode::InvalidArgument, "gating step: embedding dimension mismatch"};
    if (!std::isfinite(stepSize) || !(clip > 0.0))
        return Error{ErrorCode::InvalidArgument, "gating step: bad step size or clip"};

    GatingParameters next = *params_;
    if (degenerate(x) || stepSize == 0.0)
        return next;

    const auto act = activate(x);
    const auto& p = *params_;

    // Output layer
    std::vector<double> dHidden(p.hidden, 0.0);
    for (std::size_t k = 0; k < kStrategyCount; ++k) {
        const double g = dLogits[k];
        float* row = next.w2.data() + k * p.hidden;
        const float* oldRow = p.w2.data() + k * p.hidden;
        for (std::size_t j = 0; j < p.hidden; ++j) {
            dHidden[j] += g * oldRow[j];
            row[j] = bounded(row[j] + clipStep(stepSize * g * act.post[j], clip), paramBound);
        }
        next.b2[k] = bounded(next.b2[k] + clipStep(stepSize * g, clip), paramBound);
        next.expertBias[k] =
            bounded(next.expertBias[k] + clipStep(stepSize * g, clip), paramBound);
    }

    // Hidden layer (ReLU gate)
    for (std::size_t j = 0; j < p.hidden; ++j) {
        if (act.pre[j] <= 0.0)
            continue;
        const double dz = dHidden[j];
        float* row = next.w1.data() + j * p.inputDim;
        for (std::size_t i = 0; i < p.inputDim; ++i)
            row[i] = bounded(row[i] + clipStep(stepSize * dz * x[i], clip), paramBound);
        next.b1[j] = bounded(next.b1[j] + clipStep(stepSize * dz, clip), paramBound);
    }
    return next;
}

} // namespace rlcf::learning
