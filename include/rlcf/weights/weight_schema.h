#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rlcf::weights {

// Fixed set of retrieval/reasoning perspectives. Order is the gating output order.
enum class StrategyId : std::uint8_t { Literal = 0, Systemic = 1, Principles = 2, Precedent = 3 };

inline constexpr std::size_t kStrategyCount = 4;
inline constexpr std::array<StrategyId, kStrategyCount> kAllStrategies{
    StrategyId::Literal, StrategyId::Systemic, StrategyId::Principles, StrategyId::Precedent};

constexpr std::size_t strategyIndex(StrategyId id) noexcept {
    return static_cast<std::size_t>(id);
}

const char* strategyName(StrategyId id) noexcept;
std::optional<StrategyId> parseStrategy(std::string_view name);

// Intent class supplied by upstream preprocessing; biases the gating output.
enum class QueryType { Unknown, Definitional, Interpretive, Applicative };

const char* queryTypeName(QueryType type) noexcept;
std::optional<QueryType> parseQueryType(std::string_view name);

/**
 * Static definition of one strategy: the relation types it may traverse and the
 * prior weight of each. Learned traversal weights start at these priors and decay
 * back toward them.
 */
struct StrategyDefinition {
    StrategyId id;
    std::string name;
    std::map<std::string, double> priors; // relation_type -> prior in [0,1]
    double defaultWeight = 0.5;           // fallback when a learned value is missing

    bool allows(const std::string& relation) const { return priors.count(relation) > 0; }

    double prior(const std::string& relation) const {
        auto it = priors.find(relation);
        return it != priors.end() ? it->second : defaultWeight;
    }
};

const std::vector<StrategyDefinition>& strategyTable();
const StrategyDefinition& strategyDefinition(StrategyId id);

// Multiplicative per-strategy factors for a query type; all 1.0 for Unknown.
std::array<double, kStrategyCount> queryTypeModifiers(QueryType type);

} // namespace rlcf::weights
