#include "storage_sqlite.hpp"

#include <format>
#include <tuple>

#include <mw/error.hpp>
#include <spdlog/spdlog.h>

#include "crypto.hpp"

namespace {

// Run “f” inside a transaction. The transaction is committed if “f”
// succeeds and rolled back otherwise.
template<typename F>
E<void> inTransaction(mw::SQLite& db, F&& f)
{
    DO_OR_RETURN(db.execute("BEGIN IMMEDIATE;").transform_error(fromMwError));
    E<void> result = f();
    if(result.has_value())
    {
        auto commit = db.execute("COMMIT;");
        if(commit.has_value())
        {
            return {};
        }
        result = std::unexpected(fromMwError(commit.error()));
    }
    auto rollback = db.execute("ROLLBACK;");
    if(!rollback.has_value())
    {
        spdlog::error("Failed to roll back transaction: {}",
                      mw::errorMsg(rollback.error()));
    }
    return result;
}

Error spaceNotFound(const std::string& uuid)
{
    return notFound(std::format("Space {} not found", uuid));
}

} // namespace

SQLiteStorage::SQLiteStorage(const std::string& path) : db_path(path) {}

E<void> SQLiteStorage::init()
{
    std::lock_guard guard(db_lock);
    auto conn = mw::SQLite::connectFile(db_path);
    if(!conn)
    {
        return std::unexpected(fromMwError(conn.error()));
    }
    db = std::move(*conn);

    DO_OR_RETURN(db->execute("PRAGMA journal_mode=WAL;")
                 .transform_error(fromMwError));
    DO_OR_RETURN(db->execute("PRAGMA foreign_keys=ON;")
                 .transform_error(fromMwError));
    spdlog::info("SQLite storage at {}", db_path);
    return migrate();
}

E<void> SQLiteStorage::migrate()
{
    ASSIGN_OR_RETURN(int version, db->evalToValue<int>("PRAGMA user_version;")
                     .transform_error(fromMwError));
    if(version == 0)
    {
        spdlog::info("Creating storage schema v1...");

        const std::vector<std::string> statements = {
            R"(CREATE TABLE IF NOT EXISTS spaces (
                space_uuid TEXT PRIMARY KEY,
                space_id TEXT NOT NULL,
                controller TEXT NOT NULL
            );)",

            "CREATE INDEX IF NOT EXISTS idx_spaces_controller "
            "ON spaces (controller);",

            // Content is stored base64-encoded, so that arbitrary bytes
            // survive the text binding.
            R"(CREATE TABLE IF NOT EXISTS resources (
                space_uuid TEXT NOT NULL,
                path TEXT NOT NULL,
                content TEXT NOT NULL,
                content_type TEXT NOT NULL,
                PRIMARY KEY(space_uuid, path),
                FOREIGN KEY(space_uuid) REFERENCES spaces(space_uuid)
                    ON DELETE CASCADE
            );)",

            "PRAGMA user_version = 1;"};

        for(const auto& sql : statements)
        {
            auto res = db->execute(sql);
            if(!res)
            {
                spdlog::error("Failed to execute SQL: {}", sql);
                return std::unexpected(fromMwError(res.error()));
            }
        }
    }
    return {};
}

E<bool> SQLiteStorage::spaceExists(const std::string& uuid)
{
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(
        "SELECT 1 FROM spaces WHERE space_uuid = ?;")
                     .transform_error(fromMwError));
    DO_OR_RETURN(stmt.bind(uuid).transform_error(fromMwError));
    ASSIGN_OR_RETURN(auto rows, db->eval<int>(std::move(stmt))
                     .transform_error(fromMwError));
    return !rows.empty();
}

E<void> SQLiteStorage::putSpace(const std::string& uuid, const std::string& id,
                                const std::string& controller)
{
    std::lock_guard guard(db_lock);
    const char* sql =
        "INSERT INTO spaces (space_uuid, space_id, controller) "
        "VALUES (?, ?, ?) "
        "ON CONFLICT (space_uuid) DO UPDATE SET controller = "
        "excluded.controller;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql)
                     .transform_error(fromMwError));
    DO_OR_RETURN(stmt.bind(uuid, id, controller).transform_error(fromMwError));
    return db->execute(std::move(stmt)).transform_error(fromMwError);
}

E<Space> SQLiteStorage::getSpace(const std::string& uuid)
{
    std::lock_guard guard(db_lock);
    const char* sql = "SELECT space_uuid, space_id, controller FROM spaces "
                      "WHERE space_uuid = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql)
                     .transform_error(fromMwError));
    DO_OR_RETURN(stmt.bind(uuid).transform_error(fromMwError));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<std::string, std::string, std::string>(std::move(stmt))
         .transform_error(fromMwError)));
    if(rows.empty())
    {
        return std::unexpected(spaceNotFound(uuid));
    }
    Space s;
    s.uuid = std::get<0>(rows[0]);
    s.id = std::get<1>(rows[0]);
    s.controller = std::get<2>(rows[0]);
    return s;
}

E<void> SQLiteStorage::deleteSpace(const std::string& uuid)
{
    std::lock_guard guard(db_lock);
    return inTransaction(*db, [&]() -> E<void>
    {
        ASSIGN_OR_RETURN(bool exists, spaceExists(uuid));
        if(!exists)
        {
            return std::unexpected(spaceNotFound(uuid));
        }
        // Resources go with the space through ON DELETE CASCADE.
        ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(
            "DELETE FROM spaces WHERE space_uuid = ?;")
                         .transform_error(fromMwError));
        DO_OR_RETURN(stmt.bind(uuid).transform_error(fromMwError));
        return db->execute(std::move(stmt)).transform_error(fromMwError);
    });
}

E<std::vector<Space>> SQLiteStorage::listSpaces(const std::string& controller)
{
    std::lock_guard guard(db_lock);
    const char* sql = "SELECT space_uuid, space_id, controller FROM spaces "
                      "WHERE controller = ? ORDER BY space_uuid;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql)
                     .transform_error(fromMwError));
    DO_OR_RETURN(stmt.bind(controller).transform_error(fromMwError));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<std::string, std::string, std::string>(std::move(stmt))
         .transform_error(fromMwError)));

    std::vector<Space> spaces;
    for(const auto& row : rows)
    {
        spaces.push_back(
            Space{std::get<0>(row), std::get<1>(row), std::get<2>(row)});
    }
    return spaces;
}

E<void> SQLiteStorage::putResource(const std::string& space_uuid,
                                   const std::string& path,
                                   const std::string& content,
                                   const std::string& content_type)
{
    std::lock_guard guard(db_lock);
    return inTransaction(*db, [&]() -> E<void>
    {
        ASSIGN_OR_RETURN(bool exists, spaceExists(space_uuid));
        if(!exists)
        {
            return std::unexpected(spaceNotFound(space_uuid));
        }
        const char* sql =
            "INSERT INTO resources (space_uuid, path, content, content_type) "
            "VALUES (?, ?, ?, ?) "
            "ON CONFLICT (space_uuid, path) DO UPDATE SET "
            "content = excluded.content, "
            "content_type = excluded.content_type;";
        ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql)
                         .transform_error(fromMwError));
        DO_OR_RETURN(stmt.bind(space_uuid, path, base64Encode(content),
                               content_type).transform_error(fromMwError));
        return db->execute(std::move(stmt)).transform_error(fromMwError);
    });
}

E<Resource> SQLiteStorage::getResource(const std::string& space_uuid,
                                       const std::string& path)
{
    std::lock_guard guard(db_lock);
    ASSIGN_OR_RETURN(bool exists, spaceExists(space_uuid));
    if(!exists)
    {
        return std::unexpected(spaceNotFound(space_uuid));
    }

    const char* sql = "SELECT content, content_type FROM resources "
                      "WHERE space_uuid = ? AND path = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql)
                     .transform_error(fromMwError));
    DO_OR_RETURN(stmt.bind(space_uuid, path).transform_error(fromMwError));
    ASSIGN_OR_RETURN(auto rows,
                     (db->eval<std::string, std::string>(std::move(stmt))
                      .transform_error(fromMwError)));
    if(rows.empty())
    {
        return std::unexpected(notFound(std::format(
            "Resource {} not found in space {}", path, space_uuid)));
    }

    std::optional<std::string> content = base64Decode(std::get<0>(rows[0]));
    if(!content.has_value())
    {
        return std::unexpected(backendError(
            std::format("Corrupted content of resource {}", path)));
    }
    Resource res;
    res.space_uuid = space_uuid;
    res.path = path;
    res.content = *std::move(content);
    res.content_type = std::get<1>(rows[0]);
    return res;
}

E<void> SQLiteStorage::deleteResource(const std::string& space_uuid,
                                      const std::string& path)
{
    std::lock_guard guard(db_lock);
    return inTransaction(*db, [&]() -> E<void>
    {
        ASSIGN_OR_RETURN(bool exists, spaceExists(space_uuid));
        if(!exists)
        {
            return std::unexpected(spaceNotFound(space_uuid));
        }
        ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(
            "DELETE FROM resources WHERE space_uuid = ? AND path = ?;")
                         .transform_error(fromMwError));
        DO_OR_RETURN(stmt.bind(space_uuid, path).transform_error(fromMwError));
        return db->execute(std::move(stmt)).transform_error(fromMwError);
    });
}
