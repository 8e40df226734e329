#include <rlcf/weights/weight_schema.h>

#include <stdexcept>

namespace rlcf::weights {

const char* strategyName(StrategyId id) noexcept {
    switch (id) {
        case StrategyId::Literal: return "literal";
        case StrategyId::Systemic: return "systemic";
        case StrategyId::Principles: return "principles";
        case StrategyId::Precedent: return "precedent";
    }
    return "unknown";
}

std::optional<StrategyId> parseStrategy(std::string_view name) {
    for (auto id : kAllStrategies) {
        if (name == strategyName(id))
            return id;
    }
    return std::nullopt;
}

const char* queryTypeName(QueryType type) noexcept {
    switch (type) {
        case QueryType::Unknown: return "unknown";
        case QueryType::Definitional: return "definitional";
        case QueryType::Interpretive: return "interpretive";
        case QueryType::Applicative: return "applicative";
    }
    return "unknown";
}

std::optional<QueryType> parseQueryType(std::string_view name) {
    for (auto t : {QueryType::Unknown, QueryType::Definitional, QueryType::Interpretive,
                   QueryType::Applicative}) {
        if (name == queryTypeName(t))
            return t;
    }
    return std::nullopt;
}

const std::vector<StrategyDefinition>& strategyTable() {
    static const std::vector<StrategyDefinition> table = {
        {StrategyId::Literal,
         "literal",
         {{"contains", 1.0},
          {"governs", 0.95},
          {"defines", 0.95},
          {"amends", 0.85},
          {"repeals", 0.80},
          {"refers_to", 0.75}},
         0.5},
        {StrategyId::Systemic,
         "systemic",
         {{"hierarchy", 1.0},
          {"implements", 0.95},
          {"amends", 0.90},
          {"derogates", 0.90},
          {"governs", 0.85},
          {"contains", 0.85}},
         0.5},
        {StrategyId::Principles,
         "principles",
         {{"concept_relation", 1.0},
          {"implements", 0.95},
          {"derogates", 0.95},
          {"balances", 0.95},
          {"governs", 0.90},
          {"hierarchy", 0.90}},
         0.5},
        {StrategyId::Precedent,
         "precedent",
         {{"interprets", 1.0},
          {"applies", 1.0},
          {"confirms", 0.95},
          {"overrules", 0.95},
          {"distinguishes", 0.90},
          {"cites", 0.85}},
         0.5},
    };
    return table;
}

const StrategyDefinition& strategyDefinition(StrategyId id) {
    const auto& table = strategyTable();
    auto idx = strategyIndex(id);
    if (idx >= table.size())
        throw std::out_of_range("strategy id out of range");
    return table[idx];
}

std::array<double, kStrategyCount> queryTypeModifiers(QueryType type) {
    std::array<double, kStrategyCount> m{1.0, 1.0, 1.0, 1.0};
    switch (type) {
        case QueryType::Definitional:
            m[strategyIndex(StrategyId::Literal)] = 1.5;
            m[strategyIndex(StrategyId::Systemic)] = 0.8;
            break;
        case QueryType::Interpretive:
            m[strategyIndex(StrategyId::Principles)] = 1.3;
            m[strategyIndex(StrategyId::Precedent)] = 1.2;
            break;
        case QueryType::Applicative:
            m[strategyIndex(StrategyId::Precedent)] = 1.5;
            m[strategyIndex(StrategyId::Systemic)] = 1.1;
            break;
        case QueryType::Unknown:
            break;
    }
    return m;
}

} // namespace rlcf::weights
