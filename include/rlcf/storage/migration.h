#pragma once

#include <rlcf/core/types.h>
#include <rlcf/storage/database.h>

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace rlcf::storage {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;       ///< Migration version number
    std::string name;  ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for complex migrations)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Forward-only schema migrations recorded in migration_history
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create tables)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    Result<int> getCurrentVersion();
    int getLatestVersion() const;

    Result<bool> needsMigration();

    /**
     * @brief Apply every pending migration, each in its own transaction
     */
    Result<void> migrate();

private:
    Result<void> applyMigration(const Migration& migration);
    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");

    Database& db_;
    std::map<int, Migration> migrations_;
};

} // namespace rlcf::storage
