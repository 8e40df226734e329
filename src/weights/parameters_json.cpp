#include <rlcf/weights/parameters.h>

#include <nlohmann/json.hpp>

namespace rlcf::weights {

using nlohmann::json;

std::string toJson(const GatingParameters& params) {
    json j;
    j["input_dim"] = params.inputDim;
    j["hidden"] = params.hidden;
    j["w1"] = params.w1;
    j["b1"] = params.b1;
    j["w2"] = params.w2;
    j["b2"] = params.b2;
    j["expert_bias"] = params.expertBias;
    return j.dump();
}

Result<GatingParameters> gatingFromJson(std::string_view text) {
    try {
        auto j = json::parse(text);
        GatingParameters p;
        p.inputDim = j.at("input_dim").get<std::size_t>();
        p.hidden = j.at("hidden").get<std::size_t>();
        p.w1 = j.at("w1").get<std::vector<float>>();
        p.b1 = j.at("b1").get<std::vector<float>>();
        p.w2 = j.at("w2").get<std::vector<float>>();
        p.b2 = j.at("b2").get<std::vector<float>>();
        p.expertBias = j.at("expert_bias").get<std::vector<float>>();
        if (!p.valid())
            return Error{ErrorCode::ValidationError, "gating parameter shapes are inconsistent"};
        return p;
    } catch (const json::exception& e) {
        return Error{ErrorCode::ValidationError,
                     std::string("failed to parse gating parameters: ") + e.what()};
    }
}

std::string toJson(const RerankParameters& params) {
    json j;
    j["weights"] = params.weights;
    return j.dump();
}

Result<RerankParameters> rerankFromJson(std::string_view text) {
    try {
        auto j = json::parse(text);
        auto w = j.at("weights").get<std::vector<double>>();
        if (w.size() != kRerankFeatureCount)
            return Error{ErrorCode::ValidationError, "rerank parameters must have " +
                                                         std::to_string(kRerankFeatureCount) +
                                                         " weights"};
        RerankParameters p;
        for (std::size_t i = 0; i < kRerankFeatureCount; ++i)
            p.weights[i] = clamp01(w[i]);
        return p;
    } catch (const json::exception& e) {
        return Error{ErrorCode::ValidationError,
                     std::string("failed to parse rerank parameters: ") + e.what()};
    }
}

} // namespace rlcf::weights
