#pragma once

#include "db/idb_backend.hpp"
#include "core/database_type.hpp"
#include <functional>
#include <memory>
#include <unordered_map>

namespace dbgate {

/**
 * @brief Registry for relational backends
 *
 * Owned by the Gateway. Tests register their own factories to inject
 * fake drivers.
 *
 * Usage:
 *   auto registry = BackendRegistry::with_builtin_backends();
 *   auto backend = registry->create(DatabaseType::POSTGRESQL);
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDbBackend>()>;

    /** @brief Registry holding the MySQL, PostgreSQL and SQLite backends */
    [[nodiscard]] static std::shared_ptr<BackendRegistry> with_builtin_backends();

    void register_backend(DatabaseType type, Factory factory) {
        factories_[type] = std::move(factory);
    }

    /** @brief nullptr when no backend is registered for the type */
    [[nodiscard]] std::unique_ptr<IDbBackend> create(DatabaseType type) const {
        const auto it = factories_.find(type);
        if (it == factories_.end()) {
            return nullptr;
        }
        return it->second();
    }

    [[nodiscard]] bool has_backend(DatabaseType type) const {
        return factories_.contains(type);
    }

private:
    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

} // namespace dbgate
