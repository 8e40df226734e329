#pragma once

#include <rlcf/core/types.h>
#include <rlcf/learning/authority_calculator.h>
#include <rlcf/learning/consensus.h>
#include <rlcf/learning/decay_manager.h>
#include <rlcf/learning/policy_updater.h>
#include <rlcf/search/retrieval_engine.h>
#include <rlcf/storage/parameter_repository.h>
#include <rlcf/weights/parameter_store.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace rlcf::config {

struct LoggingConfig {
    std::string level = "info"; // trace, debug, info, warn, error, off
};

/**
 * Every tunable of the engine. Defaults are the documented production values.
 */
struct EngineConfig {
    search::RetrievalConfig retrieval;
    weights::ParameterStoreConfig parameters;
    learning::LearningConfig learning;
    learning::AuthorityConfig authority;
    learning::ConsensusConfig consensus;
    learning::DecayManager::Config decay;
    storage::StorageConfig storage;
    LoggingConfig logging;
    std::size_t trace_capacity = 10'000; // completed traces kept for feedback

    // InvalidArgument naming the first inconsistent section
    Result<void> validate() const;
};

/**
 * Applies "section.key" -> value pairs on top of base. Unknown keys are logged
 * and ignored; a malformed value for a known key is InvalidArgument.
 */
Result<EngineConfig> applyConfigValues(EngineConfig base,
                                       const std::map<std::string, std::string>& values);

// RLCF_<SECTION>_<KEY> values present in the environment, keyed "section.key".
std::map<std::string, std::string> environmentOverrides();

// Every key understood by applyConfigValues, as "section.key".
std::vector<std::string> knownConfigKeys();

/**
 * Defaults, then the file (when it exists), then environment overrides.
 * An empty path resolves through get_config_path().
 */
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path = {});

} // namespace rlcf::config
