#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <mw/database.hpp>

#include "storage.hpp"

// Relational backend. Multi-statement operations run in a transaction,
// and resources reference their space with ON DELETE CASCADE.
class SQLiteStorage : public StorageInterface
{
public:
    // “:memory:” gives a private in-memory database.
    explicit SQLiteStorage(const std::string& path);
    E<void> init() override;

    E<void> putSpace(const std::string& uuid, const std::string& id,
                     const std::string& controller) override;
    E<Space> getSpace(const std::string& uuid) override;
    E<void> deleteSpace(const std::string& uuid) override;
    E<std::vector<Space>> listSpaces(const std::string& controller) override;

    E<void> putResource(const std::string& space_uuid, const std::string& path,
                        const std::string& content,
                        const std::string& content_type) override;
    E<Resource> getResource(const std::string& space_uuid,
                            const std::string& path) override;
    E<void> deleteResource(const std::string& space_uuid,
                           const std::string& path) override;

private:
    E<void> migrate();
    E<bool> spaceExists(const std::string& uuid);

    std::string db_path;
    std::unique_ptr<mw::SQLite> db;
    // One connection is shared by all callers; transactions must not
    // interleave on it.
    std::mutex db_lock;
};
