#include <rlcf/config/config_helpers.h>
#include <rlcf/config/engine_config.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <functional>
#include <sstream>

namespace rlcf::config {

namespace {

using Setter = std::function<bool(EngineConfig&, const std::string&)>;

struct KeySpec {
    const char* section;
    const char* key;
    Setter apply;
};

template <typename F> Setter asDouble(F assign) {
    return [assign](EngineConfig& c, const std::string& v) {
        auto d = parse_double(v);
        if (!d)
            return false;
        assign(c, *d);
        return true;
    };
}

template <typename F> Setter asCount(F assign) {
    return [assign](EngineConfig& c, const std::string& v) {
        auto n = parse_int(v);
        if (!n || *n < 0)
            return false;
        assign(c, static_cast<std::size_t>(*n));
        return true;
    };
}

template <typename F> Setter asBool(F assign) {
    return [assign](EngineConfig& c, const std::string& v) {
        auto b = parse_bool(v);
        if (!b)
            return false;
        assign(c, *b);
        return true;
    };
}

template <typename F> Setter asMillis(F assign) {
    return [assign](EngineConfig& c, const std::string& v) {
        auto ms = parse_ms(v);
        if (!ms)
            return false;
        assign(c, *ms);
        return true;
    };
}

// "literal/cites, systemic/amends"
bool parseExclusions(const std::string& v,
                     std::set<std::pair<weights::StrategyId, std::string>>& out) {
    out.clear();
    std::stringstream ss(v);
    std::string item;
    while (std::getline(ss, item, ',')) {
        trim(item);
        if (item.empty())
            continue;
        auto slash = item.find('/');
        if (slash == std::string::npos)
            return false;
        auto s = weights::parseStrategy(item.substr(0, slash));
        if (!s)
            return false;
        out.emplace(*s, item.substr(slash + 1));
    }
    return true;
}

const std::vector<KeySpec>& keySpecs() {
    static const std::vector<KeySpec> specs = {
        // [retrieval]
        {"retrieval", "top_k", asCount([](EngineConfig& c, std::size_t n) { c.retrieval.top_k = n; })},
        {"retrieval", "over_retrieve_factor",
         asCount([](EngineConfig& c, std::size_t n) { c.retrieval.over_retrieve_factor = n; })},
        {"retrieval", "max_graph_hops",
         asCount([](EngineConfig& c, std::size_t n) { c.retrieval.graph.max_hops = n; })},
        {"retrieval", "strategy_timeout_ms",
         asMillis([](EngineConfig& c, std::chrono::milliseconds ms) {
             c.retrieval.strategy_timeout = ms;
         })},
        {"retrieval", "num_threads",
         asCount([](EngineConfig& c, std::size_t n) { c.retrieval.num_threads = n; })},
        {"retrieval", "min_strategy_weight",
         asDouble([](EngineConfig& c, double d) { c.retrieval.min_strategy_weight = d; })},
        {"retrieval", "neutral_graph_score",
         asDouble([](EngineConfig& c, double d) { c.retrieval.combiner.neutral_graph_score = d; })},
        {"retrieval", "follow_incoming_edges",
         asBool([](EngineConfig& c, bool b) { c.retrieval.graph.follow_incoming_edges = b; })},
        {"retrieval", "graph_budget_ms",
         asMillis([](EngineConfig& c, std::chrono::milliseconds ms) { c.retrieval.graph.budget = ms; })},
        {"retrieval", "trace_capacity",
         asCount([](EngineConfig& c, std::size_t n) { c.trace_capacity = n; })},

        // [alpha]
        {"alpha", "default",
         asDouble([](EngineConfig& c, double d) { c.parameters.alpha_default = d; })},
        {"alpha", "min", asDouble([](EngineConfig& c, double d) { c.parameters.alpha_min = d; })},
        {"alpha", "max", asDouble([](EngineConfig& c, double d) { c.parameters.alpha_max = d; })},

        // [learning]
        {"learning", "learning_rate",
         asDouble([](EngineConfig& c, double d) { c.learning.learning_rate = d; })},
        {"learning", "baseline_momentum",
         asDouble([](EngineConfig& c, double d) { c.learning.baseline_momentum = d; })},
        {"learning", "clip_gradient",
         asDouble([](EngineConfig& c, double d) { c.learning.clip_gradient = d; })},
        {"learning", "min_authority",
         asDouble([](EngineConfig& c, double d) { c.learning.min_authority = d; })},
        {"learning", "iteration_credit",
         [](EngineConfig& c, const std::string& v) {
             auto p = learning::parseIterationCredit(v);
             if (!p)
                 return false;
             c.learning.iteration_credit = *p;
             return true;
         }},
        {"learning", "iteration_credit_decay",
         asDouble([](EngineConfig& c, double d) { c.learning.iteration_credit_decay = d; })},
        {"learning", "gating_hidden",
         asCount([](EngineConfig& c, std::size_t n) { c.learning.gating.hidden = n; })},
        {"learning", "gating_param_bound", asDouble([](EngineConfig& c, double d) {
             c.learning.gating.param_bound = d;
             c.parameters.gating_param_bound = d;
         })},
        {"learning", "gating_seed", asCount([](EngineConfig& c, std::size_t n) {
             c.learning.gating.seed = static_cast<std::uint64_t>(n);
         })},

        // [authority]
        {"authority", "baseline_weight",
         asDouble([](EngineConfig& c, double d) { c.authority.baseline_weight = d; })},
        {"authority", "track_record_weight",
         asDouble([](EngineConfig& c, double d) { c.authority.track_record_weight = d; })},
        {"authority", "recent_weight",
         asDouble([](EngineConfig& c, double d) { c.authority.recent_weight = d; })},
        {"authority", "recent_window",
         asCount([](EngineConfig& c, std::size_t n) { c.authority.recent_window = n; })},
        {"authority", "neutral_prior",
         asDouble([](EngineConfig& c, double d) { c.authority.neutral_prior = d; })},
        {"authority", "async_threads",
         asCount([](EngineConfig& c, std::size_t n) { c.authority.async_threads = n; })},
        {"authority", "consensus_min_votes",
         asCount([](EngineConfig& c, std::size_t n) { c.consensus.min_votes = n; })},
        {"authority", "consensus_tolerance",
         asDouble([](EngineConfig& c, double d) { c.consensus.tolerance = d; })},
        {"authority", "agreement_threshold",
         asDouble([](EngineConfig& c, double d) { c.consensus.agreement_threshold = d; })},
        {"authority", "controversy_threshold",
         asDouble([](EngineConfig& c, double d) { c.consensus.controversy_threshold = d; })},

        // [decay]
        {"decay", "rate", asDouble([](EngineConfig& c, double d) { c.decay.rate = d; })},
        {"decay", "interval_s", asCount([](EngineConfig& c, std::size_t n) {
             c.decay.interval = std::chrono::seconds(static_cast<long long>(n));
         })},
        {"decay", "reinforcement_grace_h", asCount([](EngineConfig& c, std::size_t n) {
             c.decay.reinforcement_grace = std::chrono::hours(static_cast<long long>(n));
         })},
        {"decay", "enabled", asBool([](EngineConfig& c, bool b) { c.decay.enabled = b; })},
        {"decay", "exclude",
         [](EngineConfig& c, const std::string& v) { return parseExclusions(v, c.decay.excluded); }},

        // [storage]
        {"storage", "path",
         [](EngineConfig& c, const std::string& v) {
             c.storage.path = v.empty() ? std::string() : expand_tilde(v).string();
             return true;
         }},
        {"storage", "wal", asBool([](EngineConfig& c, bool b) { c.storage.wal = b; })},
        {"storage", "busy_timeout_ms",
         asMillis([](EngineConfig& c, std::chrono::milliseconds ms) { c.storage.busy_timeout = ms; })},
        {"storage", "log_memory_entries",
         asCount([](EngineConfig& c, std::size_t n) { c.storage.log_memory_entries = n; })},

        // [logging]
        {"logging", "level",
         [](EngineConfig& c, const std::string& v) {
             const auto lvl = spdlog::level::from_str(v);
             if (lvl == spdlog::level::off && v != "off")
                 return false;
             c.logging.level = v;
             return true;
         }},
    };
    return specs;
}

} // namespace

Result<void> EngineConfig::validate() const {
    if (!retrieval.isValid())
        return Error{ErrorCode::InvalidArgument, "invalid [retrieval] configuration"};
    if (retrieval.graph.max_hops == 0)
        return Error{ErrorCode::InvalidArgument, "retrieval.max_graph_hops must be positive"};
    if (!parameters.isValid())
        return Error{ErrorCode::InvalidArgument, "invalid [alpha] configuration"};
    if (!learning.isValid())
        return Error{ErrorCode::InvalidArgument, "invalid [learning] configuration"};
    if (!authority.isValid())
        return Error{ErrorCode::InvalidArgument,
                     "invalid [authority] configuration (weights must sum to 1)"};
    if (!consensus.isValid())
        return Error{ErrorCode::InvalidArgument, "invalid consensus thresholds in [authority]"};
    if (!decay.isValid())
        return Error{ErrorCode::InvalidArgument, "invalid [decay] configuration"};
    if (trace_capacity == 0)
        return Error{ErrorCode::InvalidArgument, "retrieval.trace_capacity must be positive"};
    if (storage.log_memory_entries == 0)
        return Error{ErrorCode::InvalidArgument, "storage.log_memory_entries must be positive"};
    return {};
}

Result<EngineConfig> applyConfigValues(EngineConfig base,
                                       const std::map<std::string, std::string>& values) {
    for (const auto& [name, value] : values) {
        const KeySpec* match = nullptr;
        for (const auto& s : keySpecs()) {
            if (name == std::string(s.section) + "." + s.key) {
                match = &s;
                break;
            }
        }
        if (!match) {
            spdlog::warn("[Config] Ignoring unknown key '{}'", name);
            continue;
        }
        if (!match->apply(base, value))
            return Error{ErrorCode::InvalidArgument,
                         "invalid value '" + value + "' for " + name};
    }
    return base;
}

std::map<std::string, std::string> environmentOverrides() {
    std::map<std::string, std::string> out;
    for (const auto& s : keySpecs()) {
        const auto var = env_override_name(s.section, s.key);
        if (const char* v = std::getenv(var.c_str()); v != nullptr)
            out[std::string(s.section) + "." + s.key] = v;
    }
    // Short alias for the log level
    if (const char* v = std::getenv("RLCF_LOG_LEVEL"); v != nullptr)
        out["logging.level"] = v;
    return out;
}

std::vector<std::string> knownConfigKeys() {
    std::vector<std::string> out;
    for (const auto& s : keySpecs())
        out.push_back(std::string(s.section) + "." + s.key);
    return out;
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path) {
    const auto resolved = path.empty() ? get_config_path() : path;

    EngineConfig config;
    std::error_code ec;
    if (std::filesystem::exists(resolved, ec)) {
        auto applied = applyConfigValues(config, parse_config_file(resolved));
        if (!applied)
            return Error{applied.error().code,
                         resolved.string() + ": " + applied.error().message};
        config = std::move(applied).value();
        spdlog::debug("[Config] Loaded {}", resolved.string());
    } else if (!path.empty()) {
        return Error{ErrorCode::NotFound, "config file not found: " + resolved.string()};
    }

    auto withEnv = applyConfigValues(std::move(config), environmentOverrides());
    if (!withEnv)
        return withEnv.error();

    if (auto v = withEnv.value().validate(); !v)
        return v.error();
    return withEnv;
}

} // namespace rlcf::config
