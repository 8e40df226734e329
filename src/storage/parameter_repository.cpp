#include <rlcf/bridge/bridge_index.h>
#include <rlcf/storage/migration.h>
#include <rlcf/storage/parameter_repository.h>
#include <rlcf/weights/parameter_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>

namespace rlcf::storage {

using weights::ParameterKind;
using weights::ParameterRef;

namespace {

int64_t toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromMillis(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

std::string encodeRecent(const std::deque<bool>& recent) {
    std::string s;
    s.reserve(recent.size());
    for (bool b : recent)
        s.push_back(b ? '1' : '0');
    return s;
}

std::deque<bool> decodeRecent(const std::string& s) {
    std::deque<bool> out;
    for (char c : s)
        out.push_back(c == '1');
    return out;
}

std::vector<Migration> schemaMigrations() {
    std::vector<Migration> m;

    m.push_back(Migration{1, "Create learned parameter tables", R"(
        CREATE TABLE IF NOT EXISTS traversal_weights (
            strategy TEXT NOT NULL,
            relation TEXT NOT NULL,
            weight REAL NOT NULL,
            version INTEGER NOT NULL,
            last_reinforced INTEGER NOT NULL,
            last_decayed INTEGER NOT NULL,
            PRIMARY KEY (strategy, relation)
        );
        CREATE TABLE IF NOT EXISTS alpha_values (
            strategy TEXT PRIMARY KEY,
            alpha REAL NOT NULL,
            version INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS parameter_blobs (
            name TEXT PRIMARY KEY,
            data TEXT NOT NULL,
            version INTEGER NOT NULL
        );
    )",
                                {}});

    m.push_back(Migration{2, "Create bridge mapping table", R"(
        CREATE TABLE IF NOT EXISTS bridge_mappings (
            chunk_id TEXT NOT NULL,
            node_id TEXT NOT NULL,
            relation_type TEXT NOT NULL,
            weight REAL NOT NULL,
            confidence REAL NOT NULL,
            source TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            version INTEGER NOT NULL,
            PRIMARY KEY (chunk_id, node_id, relation_type)
        );
        CREATE INDEX IF NOT EXISTS idx_bridge_node ON bridge_mappings(node_id);
    )",
                                {}});

    m.push_back(Migration{3, "Create authority tables", R"(
        CREATE TABLE IF NOT EXISTS user_authority (
            user_id TEXT NOT NULL,
            level TEXT NOT NULL,
            domain TEXT NOT NULL,
            confirmed INTEGER NOT NULL,
            validated INTEGER NOT NULL,
            recent TEXT NOT NULL,
            version INTEGER NOT NULL,
            PRIMARY KEY (user_id, level, domain)
        );
        CREATE TABLE IF NOT EXISTS user_credentials (
            user_id TEXT PRIMARY KEY,
            baseline REAL NOT NULL
        );
    )",
                                {}});

    m.push_back(Migration{4, "Create change log and processed feedback", R"(
        CREATE TABLE IF NOT EXISTS parameter_log (
            seq INTEGER PRIMARY KEY,
            ts INTEGER NOT NULL,
            feedback_id TEXT NOT NULL,
            kind TEXT NOT NULL,
            strategy TEXT,
            relation TEXT,
            chunk_id TEXT,
            node_id TEXT,
            old_value TEXT NOT NULL,
            new_value TEXT NOT NULL,
            version INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_parameter_log_feedback ON parameter_log(feedback_id);
        CREATE TABLE IF NOT EXISTS processed_feedback (
            feedback_id TEXT PRIMARY KEY,
            trace_id TEXT NOT NULL,
            received_at INTEGER NOT NULL,
            r_retrieval REAL NOT NULL,
            r_reasoning REAL NOT NULL,
            r_synthesis REAL NOT NULL
        );
    )",
                                {}});
    return m;
}

} // namespace

Result<std::unique_ptr<ParameterRepository>>
ParameterRepository::open(const StorageConfig& config) {
    if (config.path.empty())
        return Error{ErrorCode::InvalidArgument, "storage path is empty"};

    const std::filesystem::path p(config.path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec)
            return Error{ErrorCode::DatabaseError, "cannot create " + p.parent_path().string() +
                                                       ": " + ec.message()};
    }

    Database db;
    if (auto r = db.open(config.path, ConnectionMode::Create); !r)
        return r.error();
    if (auto r = db.setBusyTimeout(config.busy_timeout); !r)
        return r.error();
    if (config.wal) {
        if (auto r = db.enableWAL(); !r)
            spdlog::warn("[Storage] WAL unavailable for {}: {}", config.path, r.error().message);
    }

    MigrationManager mm(db);
    if (auto r = mm.initialize(); !r)
        return r.error();
    mm.registerMigrations(schemaMigrations());
    if (auto r = mm.migrate(); !r)
        return r.error();

    spdlog::info("[Storage] Opened {} (sqlite {})", config.path, Database::version());
    return std::unique_ptr<ParameterRepository>(new ParameterRepository(std::move(db)));
}

ParameterRepository::ParameterRepository(Database db) : db_(std::move(db)) {}

ParameterRepository::~ParameterRepository() = default;

Result<int> ParameterRepository::schemaVersion() {
    std::lock_guard<std::mutex> lock(mutex_);
    MigrationManager mm(db_);
    return mm.getCurrentVersion();
}

Result<void> ParameterRepository::saveParameter(const weights::ParameterRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (row.ref.kind) {
        case ParameterKind::Traversal: {
            auto v = weights::parseScalar(row.value);
            if (!v)
                return Error{ErrorCode::ValidationError, "bad traversal value " + row.value};
            auto stmt = db_.prepare(
                "INSERT INTO traversal_weights "
                "(strategy, relation, weight, version, last_reinforced, last_decayed) "
                "VALUES (?, ?, ?, ?, ?, ?) "
                "ON CONFLICT(strategy, relation) DO UPDATE SET "
                "weight = excluded.weight, version = excluded.version, "
                "last_reinforced = excluded.last_reinforced, last_decayed = excluded.last_decayed "
                "WHERE excluded.version > traversal_weights.version");
            if (!stmt)
                return stmt.error();
            auto s = std::move(stmt).value();
            if (auto b = s.bindAll(std::string(weights::strategyName(row.ref.strategy)),
                                   row.ref.relation, *v, row.version, toMillis(row.lastReinforced),
                                   toMillis(row.lastDecayed));
                !b)
                return b;
            return s.execute();
        }
        case ParameterKind::Alpha: {
            auto v = weights::parseScalar(row.value);
            if (!v)
                return Error{ErrorCode::ValidationError, "bad alpha value " + row.value};
            auto stmt = db_.prepare("INSERT INTO alpha_values (strategy, alpha, version) "
                                    "VALUES (?, ?, ?) "
                                    "ON CONFLICT(strategy) DO UPDATE SET "
                                    "alpha = excluded.alpha, version = excluded.version "
                                    "WHERE excluded.version > alpha_values.version");
            if (!stmt)
                return stmt.error();
            auto s = std::move(stmt).value();
            if (auto b = s.bindAll(std::string(weights::strategyName(row.ref.strategy)), *v,
                                   row.version);
                !b)
                return b;
            return s.execute();
        }
        case ParameterKind::Gating:
            return upsertBlob("gating", row.value, row.version);
        case ParameterKind::Rerank:
            return upsertBlob("rerank", row.value, row.version);
        case ParameterKind::Bridge:
            return Error{ErrorCode::InvalidArgument,
                         "bridge weights are persisted with their mapping"};
    }
    return Error{ErrorCode::InvalidArgument, "unknown parameter kind"};
}

Result<void> ParameterRepository::upsertBlob(const std::string& name, const std::string& data,
                                             std::uint64_t version) {
    auto stmt = db_.prepare("INSERT INTO parameter_blobs (name, data, version) VALUES (?, ?, ?) "
                            "ON CONFLICT(name) DO UPDATE SET "
                            "data = excluded.data, version = excluded.version "
                            "WHERE excluded.version > parameter_blobs.version");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    if (auto b = s.bindAll(name, data, version); !b)
        return b;
    return s.execute();
}

Result<void> ParameterRepository::saveBridgeMapping(const bridge::BridgeMapping& m,
                                                    std::uint64_t version) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(
        "INSERT INTO bridge_mappings (chunk_id, node_id, relation_type, weight, confidence, "
        "source, created_at, updated_at, version) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(chunk_id, node_id, relation_type) DO UPDATE SET "
        "weight = excluded.weight, confidence = excluded.confidence, source = excluded.source, "
        "updated_at = excluded.updated_at, version = excluded.version "
        "WHERE excluded.version > bridge_mappings.version");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    if (auto b = s.bindAll(m.chunkId, m.nodeId, m.relationType, m.weight, m.confidence, m.source,
                           toMillis(m.createdAt), toMillis(m.updatedAt), version);
        !b)
        return b;
    return s.execute();
}

Result<void> ParameterRepository::saveAuthority(const learning::AuthorityRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(
        "INSERT INTO user_authority (user_id, level, domain, confirmed, validated, recent, "
        "version) VALUES (?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(user_id, level, domain) DO UPDATE SET "
        "confirmed = excluded.confirmed, validated = excluded.validated, "
        "recent = excluded.recent, version = excluded.version "
        "WHERE excluded.version > user_authority.version");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    if (auto b = s.bindAll(row.key.userId, std::string(learning::levelName(row.key.level)),
                           row.key.domain, row.record.confirmed, row.record.validated,
                           encodeRecent(row.record.recent), row.version);
        !b)
        return b;
    return s.execute();
}

Result<void> ParameterRepository::saveCredential(const UserId& user, double baseline) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("INSERT INTO user_credentials (user_id, baseline) VALUES (?, ?) "
                            "ON CONFLICT(user_id) DO UPDATE SET baseline = excluded.baseline");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    if (auto b = s.bindAll(user, baseline); !b)
        return b;
    return s.execute();
}

Result<void> ParameterRepository::appendLog(const weights::ChangeLogEntry& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(
        "INSERT OR IGNORE INTO parameter_log (seq, ts, feedback_id, kind, strategy, relation, "
        "chunk_id, node_id, old_value, new_value, version) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    if (auto b = s.bindAll(e.sequence, toMillis(e.timestamp), e.feedbackId,
                           std::string(weights::parameterKindName(e.ref.kind)),
                           std::string(weights::strategyName(e.ref.strategy)), e.ref.relation,
                           e.ref.chunkId, e.ref.nodeId, e.oldValue, e.newValue, e.version);
        !b)
        return b;
    return s.execute();
}

Result<void> ParameterRepository::saveBaselines(
    const std::array<double, learning::kLevelCount>& values, std::uint64_t version) {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json j;
    j["values"] = values;
    return upsertBlob("baselines", j.dump(), version);
}

Result<bool> ParameterRepository::recordFeedback(const ProcessedFeedback& f) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("INSERT OR IGNORE INTO processed_feedback (feedback_id, trace_id, "
                            "received_at, r_retrieval, r_reasoning, r_synthesis) "
                            "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    if (auto b = s.bindAll(f.feedbackId, f.traceId, toMillis(f.receivedAt), f.rewards[0],
                           f.rewards[1], f.rewards[2]);
        !b)
        return b.error();
    if (auto r = s.execute(); !r)
        return r.error();
    return db_.changes() > 0;
}

Result<void> ParameterRepository::loadParameters(weights::ParameterStore& store) {
    std::lock_guard<std::mutex> lock(mutex_);
    {
        auto stmt = db_.prepare("SELECT strategy, relation, weight, version, last_reinforced, "
                                "last_decayed FROM traversal_weights");
        if (!stmt)
            return stmt.error();
        auto s = std::move(stmt).value();
        while (true) {
            auto row = s.step();
            if (!row)
                return row.error();
            if (!row.value())
                break;
            auto strategy = weights::parseStrategy(s.getString(0));
            const auto relation = s.getString(1);
            if (!strategy || !weights::strategyDefinition(*strategy).allows(relation)) {
                spdlog::warn("[Storage] Ignoring traversal row {}/{}", s.getString(0), relation);
                continue;
            }
            weights::TraversalWeight w;
            w.weight = clamp01(s.getDouble(2));
            w.prior = weights::strategyDefinition(*strategy).prior(relation);
            w.lastReinforced = fromMillis(s.getInt64(4));
            w.lastDecayed = fromMillis(s.getInt64(5));
            store.loadTraversal(*strategy, relation, w, static_cast<std::uint64_t>(s.getInt64(3)));
        }
    }
    {
        auto stmt = db_.prepare("SELECT strategy, alpha, version FROM alpha_values");
        if (!stmt)
            return stmt.error();
        auto s = std::move(stmt).value();
        while (true) {
            auto row = s.step();
            if (!row)
                return row.error();
            if (!row.value())
                break;
            auto strategy = weights::parseStrategy(s.getString(0));
            if (!strategy)
                continue;
            store.loadAlpha(*strategy, s.getDouble(1), static_cast<std::uint64_t>(s.getInt64(2)));
        }
    }
    {
        auto stmt = db_.prepare(
            "SELECT name, data, version FROM parameter_blobs WHERE name IN ('gating', 'rerank')");
        if (!stmt)
            return stmt.error();
        auto s = std::move(stmt).value();
        while (true) {
            auto row = s.step();
            if (!row)
                return row.error();
            if (!row.value())
                break;
            const auto name = s.getString(0);
            const auto version = static_cast<std::uint64_t>(s.getInt64(2));
            if (name == "gating") {
                auto g = weights::gatingFromJson(s.getString(1));
                if (!g)
                    return g.error();
                store.loadGating(std::move(g).value(), version);
            } else {
                auto r = weights::rerankFromJson(s.getString(1));
                if (!r)
                    return r.error();
                store.loadRerank(r.value(), version);
            }
        }
    }
    return {};
}

Result<void> ParameterRepository::loadBridge(bridge::BridgeIndex& index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT chunk_id, node_id, relation_type, weight, confidence, source, "
                            "created_at, updated_at, version FROM bridge_mappings");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    std::size_t n = 0;
    while (true) {
        auto row = s.step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        bridge::BridgeMapping m;
        m.chunkId = s.getString(0);
        m.nodeId = s.getString(1);
        m.relationType = s.getString(2);
        m.weight = clamp01(s.getDouble(3));
        m.confidence = clamp01(s.getDouble(4));
        m.source = s.getString(5);
        m.createdAt = fromMillis(s.getInt64(6));
        m.updatedAt = fromMillis(s.getInt64(7));
        index.load(m, static_cast<std::uint64_t>(s.getInt64(8)));
        ++n;
    }
    spdlog::debug("[Storage] Loaded {} bridge mappings", n);
    return {};
}

Result<void> ParameterRepository::loadAuthority(learning::AuthorityCalculator& calculator) {
    std::lock_guard<std::mutex> lock(mutex_);
    {
        auto stmt = db_.prepare("SELECT user_id, level, domain, confirmed, validated, recent, "
                                "version FROM user_authority");
        if (!stmt)
            return stmt.error();
        auto s = std::move(stmt).value();
        while (true) {
            auto row = s.step();
            if (!row)
                return row.error();
            if (!row.value())
                break;
            auto level = learning::parseLevel(s.getString(1));
            if (!level)
                continue;
            learning::AuthorityRecord rec;
            rec.confirmed = static_cast<std::uint64_t>(s.getInt64(3));
            rec.validated = static_cast<std::uint64_t>(s.getInt64(4));
            rec.recent = decodeRecent(s.getString(5));
            calculator.loadRecord(learning::AuthorityKey{s.getString(0), *level, s.getString(2)},
                                  std::move(rec), static_cast<std::uint64_t>(s.getInt64(6)));
        }
    }
    {
        auto stmt = db_.prepare("SELECT user_id, baseline FROM user_credentials");
        if (!stmt)
            return stmt.error();
        auto s = std::move(stmt).value();
        while (true) {
            auto row = s.step();
            if (!row)
                return row.error();
            if (!row.value())
                break;
            calculator.loadBaseline(s.getString(0), s.getDouble(1));
        }
    }
    return {};
}

namespace {

constexpr const char* kLogColumns = "seq, ts, feedback_id, kind, strategy, relation, chunk_id, "
                                    "node_id, old_value, new_value, version";

Result<std::vector<weights::ChangeLogEntry>> readLogRows(Statement& s) {
    std::vector<weights::ChangeLogEntry> out;
    while (true) {
        auto row = s.step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        auto kind = weights::parseParameterKind(s.getString(3));
        if (!kind)
            return Error{ErrorCode::DatabaseError, "unknown parameter kind in log: " +
                                                       s.getString(3)};
        weights::ChangeLogEntry e;
        e.sequence = static_cast<std::uint64_t>(s.getInt64(0));
        e.timestamp = fromMillis(s.getInt64(1));
        e.feedbackId = s.getString(2);
        e.ref.kind = *kind;
        e.ref.strategy = weights::parseStrategy(s.getString(4)).value_or(weights::StrategyId::Literal);
        e.ref.relation = s.getString(5);
        e.ref.chunkId = s.getString(6);
        e.ref.nodeId = s.getString(7);
        e.oldValue = s.getString(8);
        e.newValue = s.getString(9);
        e.version = static_cast<std::uint64_t>(s.getInt64(10));
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace

Result<std::vector<weights::ChangeLogEntry>>
ParameterRepository::loadChangeLog(std::uint64_t afterSequence, std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(std::string("SELECT ") + kLogColumns +
                            " FROM parameter_log WHERE seq > ? ORDER BY seq LIMIT ?");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    // LIMIT -1 means no limit in SQLite
    const auto max = limit == 0 ? static_cast<std::int64_t>(-1) : static_cast<std::int64_t>(limit);
    if (auto b = s.bindAll(static_cast<std::int64_t>(afterSequence), max); !b)
        return b.error();
    return readLogRows(s);
}

Result<std::vector<weights::ChangeLogEntry>>
ParameterRepository::loadChangeLogTail(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(std::string("SELECT * FROM (SELECT ") + kLogColumns +
                            " FROM parameter_log ORDER BY seq DESC LIMIT ?) ORDER BY seq");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    if (auto b = s.bind(1, static_cast<std::int64_t>(count)); !b)
        return b.error();
    return readLogRows(s);
}

Result<std::uint64_t> ParameterRepository::lastLogSequence() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT COALESCE(MAX(seq), 0) FROM parameter_log");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    auto row = s.step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::uint64_t{0};
    return static_cast<std::uint64_t>(s.getInt64(0));
}

Result<std::vector<std::string>> ParameterRepository::loadProcessedFeedbackIds() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT feedback_id FROM processed_feedback");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    std::vector<std::string> out;
    while (true) {
        auto row = s.step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        out.push_back(s.getString(0));
    }
    return out;
}

Result<std::optional<std::array<double, learning::kLevelCount>>>
ParameterRepository::loadBaselines() {
    std::lock_guard<std::mutex> lock(mutex_);
    using Baselines = std::array<double, learning::kLevelCount>;
    auto stmt = db_.prepare("SELECT data FROM parameter_blobs WHERE name = 'baselines'");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    auto row = s.step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::optional<Baselines>{};
    try {
        auto j = nlohmann::json::parse(s.getString(0));
        auto values = j.at("values").get<std::vector<double>>();
        if (values.size() != learning::kLevelCount)
            return Error{ErrorCode::DatabaseError, "baseline blob has wrong length"};
        Baselines b{};
        for (std::size_t i = 0; i < b.size(); ++i)
            b[i] = values[i];
        return std::optional<Baselines>{b};
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::DatabaseError, std::string("bad baseline blob: ") + e.what()};
    }
}

} // namespace rlcf::storage
