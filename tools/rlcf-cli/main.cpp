#include <rlcf/api/engine.h>
#include <rlcf/config/engine_config.h>
#include <rlcf/weights/weight_schema.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

namespace {

using json = nlohmann::json;

json snapshotJson(const rlcf::weights::ParameterSnapshot& snap) {
    json out;
    out["generation"] = snap.generation;
    json strategies = json::object();
    for (auto s : rlcf::weights::kAllStrategies) {
        const auto idx = rlcf::weights::strategyIndex(s);
        json entry;
        entry["alpha"] = snap.alpha[idx];
        entry["traversal"] = snap.traversal[idx];
        strategies[rlcf::weights::strategyName(s)] = std::move(entry);
    }
    out["strategies"] = std::move(strategies);
    out["rerank"] = snap.rerank.weights;
    if (snap.gating) {
        out["gating"] = {{"input_dim", snap.gating->inputDim}, {"hidden", snap.gating->hidden}};
    } else {
        out["gating"] = nullptr;
    }
    return out;
}

json logEntryJson(const rlcf::weights::ChangeLogEntry& e) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        e.timestamp.time_since_epoch())
                        .count();
    return json{{"seq", e.sequence},       {"ts_ms", ms},
                {"feedback_id", e.feedbackId}, {"key", e.ref.describe()},
                {"old", e.oldValue},       {"new", e.newValue},
                {"version", e.version}};
}

} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    CLI::App app{"rlcf maintenance tool"};
    app.require_subcommand(1);

    std::string configPath;
    bool debug = false;
    app.add_option("-c,--config", configPath, "Configuration file (TOML)");
    app.add_flag("--debug", debug, "Enable debug logging");

    auto* snapshotCmd = app.add_subcommand("snapshot", "Print every learned parameter");

    double days = 0.0;
    auto* decayCmd = app.add_subcommand("decay", "Run one decay sweep");
    decayCmd->add_option("--days", days, "Sweep as if this many days had passed")
        ->default_val(0.0)
        ->check(CLI::NonNegativeNumber);

    std::uint64_t rollbackSeq = 0;
    auto* rollbackCmd = app.add_subcommand("rollback", "Revert every change after a sequence");
    rollbackCmd->add_option("seq", rollbackSeq, "Last change log sequence to keep")->required();

    std::size_t limit = 50;
    std::uint64_t after = 0;
    auto* logCmd = app.add_subcommand("log", "Print the parameter change log");
    logCmd->add_option("--limit", limit, "Maximum entries (0 = all)")->default_val(50);
    logCmd->add_option("--after", after, "Only entries after this sequence")->default_val(0);

    CLI11_PARSE(app, argc, argv);

    auto loaded = rlcf::config::loadEngineConfig(configPath);
    if (!loaded) {
        std::cerr << "Error: " << loaded.error().message << std::endl;
        return 1;
    }
    auto config = std::move(loaded).value();
    if (debug)
        config.logging.level = "debug";
    if (config.storage.path.empty())
        spdlog::warn("[cli] storage.path is empty; operating on a transient in-memory store");

    auto created = rlcf::api::Engine::create(std::move(config));
    if (!created) {
        std::cerr << "Error: " << created.error().message << std::endl;
        return 1;
    }
    auto engine = std::move(created).value();

    if (snapshotCmd->parsed()) {
        std::cout << snapshotJson(*engine->getParameterSnapshot()).dump(2) << std::endl;
        return 0;
    }

    if (decayCmd->parsed()) {
        const auto offset = std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double, std::ratio<86400>>(days));
        const auto report = engine->runDecaySweep(std::chrono::system_clock::now() + offset);
        std::cout << json{{"examined", report.examined},
                          {"decayed", report.decayed},
                          {"skipped", report.skipped},
                          {"failed", report.failed}}
                         .dump(2)
                  << std::endl;
        return report.failed == 0 ? 0 : 2;
    }

    if (rollbackCmd->parsed()) {
        auto report = engine->rollbackTo(rollbackSeq);
        if (!report) {
            std::cerr << "Error: " << report.error().message << std::endl;
            return 1;
        }
        std::cout << json{{"target", report.value().targetSequence},
                          {"reverted", report.value().keysReverted},
                          {"failed", report.value().keysFailed}}
                         .dump(2)
                  << std::endl;
        return report.value().keysFailed == 0 ? 0 : 2;
    }

    if (logCmd->parsed()) {
        auto log = engine->changeLog(after, limit);
        if (!log) {
            std::cerr << "Error: " << log.error().message << std::endl;
            return 1;
        }
        json entries = json::array();
        for (const auto& e : log.value())
            entries.push_back(logEntryJson(e));
        std::cout << entries.dump(2) << std::endl;
        return 0;
    }

    return 0;
}
