#pragma once

#include "harvest_core/db/connection_pool.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace harvest_core {

// Owns the connection pool. One instance is created at startup and handed by
// reference to the stores that need it.
class DatabaseManager {
public:
    DatabaseManager() = default;
    ~DatabaseManager();

    // Creates the parent directory and schema, then opens pool_size connections.
    void initialize(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();
    bool is_initialized() const { return is_initialized_; }
    std::size_t available_connections() const;

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema(const std::filesystem::path& db_path, const std::string& db_key);

    std::unique_ptr<ConnectionPool> pool_;
    bool is_initialized_ = false;
};

} // namespace harvest_core
