#include "storage_factory.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "storage_filesystem.hpp"
#include "storage_memory.hpp"
#include "storage_sqlite.hpp"

E<std::unique_ptr<StorageInterface>> createStorage(const StorageConfig& config)
{
    std::unique_ptr<StorageInterface> storage;
    if(config.backend == "memory")
    {
        storage = std::make_unique<MemoryStorage>();
    }
    else if(config.backend == "filesystem")
    {
        if(config.root_dir.empty())
        {
            return std::unexpected(makeError(
                ErrorCode::INVALID_REQUEST,
                "Filesystem backend requires storage.root_dir"));
        }
        storage = std::make_unique<FilesystemStorage>(config.root_dir);
    }
    else if(config.backend == "sqlite")
    {
        if(config.db_path.empty())
        {
            return std::unexpected(makeError(
                ErrorCode::INVALID_REQUEST,
                "SQLite backend requires storage.db_path"));
        }
        storage = std::make_unique<SQLiteStorage>(config.db_path);
    }
    else
    {
        return std::unexpected(makeError(
            ErrorCode::INVALID_REQUEST,
            std::format("Unknown storage backend: {}", config.backend)));
    }

    spdlog::info("Using {} storage backend", config.backend);
    DO_OR_RETURN(storage->init());
    return storage;
}
