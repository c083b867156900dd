#include "storage_filesystem.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <mutex>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "crypto.hpp"

namespace fs = std::filesystem;

namespace {

constexpr char SPACES_DIR[] = "spaces";
constexpr char TRASH_DIR[] = "trash";
constexpr char RESOURCES_DIR[] = "resources";
constexpr char META_FILE[] = "space.json";
// Well below NAME_MAX of common filesystems, leaving room for the
// kind letter.
constexpr size_t MAX_ENCODED_NAME = 200;

Error ioError(const std::string& what, const fs::path& p)
{
    return backendError(std::format("Failed to {} {}", what, p.string()));
}

// Write to a temporary file beside “target”, then rename it over
// “target”.
E<void> atomicWrite(const fs::path& target, std::string_view data)
{
    fs::path tmp = target.parent_path() /
        std::format(".tmp-{}", generateUuid());
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if(!f)
        {
            return std::unexpected(ioError("create", tmp));
        }
        f.write(data.data(), static_cast<std::streamsize>(data.size()));
        f.flush();
        if(!f)
        {
            f.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            return std::unexpected(ioError("write", tmp));
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if(ec)
    {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return std::unexpected(backendError(std::format(
            "Failed to rename {} to {}: {}", tmp.string(), target.string(),
            ec.message())));
    }
    return {};
}

E<std::string> readFile(const fs::path& p)
{
    std::ifstream f(p, std::ios::binary);
    if(!f)
    {
        std::error_code ec;
        if(!fs::exists(p, ec))
        {
            return std::unexpected(notFound(
                std::format("{} does not exist", p.filename().string())));
        }
        return std::unexpected(ioError("open", p));
    }
    std::stringstream ss;
    ss << f.rdbuf();
    if(f.bad())
    {
        return std::unexpected(ioError("read", p));
    }
    return ss.str();
}

} // namespace

FilesystemStorage::FilesystemStorage(const std::string& root_dir)
    : root(root_dir)
{
}

E<void> FilesystemStorage::init()
{
    for(const char* dir : {SPACES_DIR, TRASH_DIR})
    {
        std::error_code ec;
        fs::create_directories(root / dir, ec);
        if(ec)
        {
            return std::unexpected(ioError("create", root / dir));
        }
    }
    // Whatever is left in the trash is from deletions that were
    // interrupted. Those spaces are already gone as far as readers
    // are concerned.
    std::error_code ec;
    for(fs::directory_iterator it(root / TRASH_DIR, ec);
        !ec && it != fs::directory_iterator(); it.increment(ec))
    {
        std::error_code rm_ec;
        fs::remove_all(it->path(), rm_ec);
    }
    spdlog::info("Filesystem storage at {}", root.string());
    return {};
}

std::string FilesystemStorage::encodeName(std::string_view name)
{
    std::string result;
    for(char c : name)
    {
        const auto u = static_cast<unsigned char>(c);
        if((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '~')
        {
            result += c;
        }
        else
        {
            result += std::format("%{:02X}", u);
        }
    }
    return result;
}

std::string FilesystemStorage::fileName(char kind, std::string_view name)
{
    std::string encoded = encodeName(name);
    if(encoded.size() > MAX_ENCODED_NAME)
    {
        return std::format("h{}", sha256Hex(name));
    }
    return std::format("{}{}", kind, encoded);
}

fs::path FilesystemStorage::spaceDir(const std::string& uuid) const
{
    return root / SPACES_DIR / fileName('s', uuid);
}

fs::path FilesystemStorage::metaPath(const std::string& uuid) const
{
    return spaceDir(uuid) / META_FILE;
}

fs::path FilesystemStorage::resourcePath(const std::string& space_uuid,
                                         const std::string& path) const
{
    return spaceDir(space_uuid) / RESOURCES_DIR / fileName('r', path);
}

E<Space> FilesystemStorage::readSpace(const fs::path& meta_path) const
{
    ASSIGN_OR_RETURN(std::string text, readFile(meta_path));
    try
    {
        auto j = nlohmann::json::parse(text);
        Space s;
        s.uuid = j.at("uuid").get<std::string>();
        s.id = j.at("id").get<std::string>();
        s.controller = j.at("controller").get<std::string>();
        return s;
    }
    catch(const nlohmann::json::exception& e)
    {
        return std::unexpected(backendError(std::format(
            "Corrupted space record {}: {}", meta_path.string(), e.what())));
    }
}

E<void> FilesystemStorage::putSpace(const std::string& uuid,
                                    const std::string& id,
                                    const std::string& controller)
{
    std::unique_lock guard(space_lock);
    nlohmann::json meta = {
        {"uuid", uuid},
        {"id", id},
        {"controller", controller},
    };

    auto existing = readSpace(metaPath(uuid));
    if(existing.has_value())
    {
        meta["id"] = existing->id;
    }
    else if(existing.error().code != ErrorCode::NOT_FOUND)
    {
        return std::unexpected(existing.error());
    }
    else
    {
        std::error_code ec;
        fs::create_directories(spaceDir(uuid) / RESOURCES_DIR, ec);
        if(ec)
        {
            return std::unexpected(ioError("create", spaceDir(uuid)));
        }
    }
    return atomicWrite(metaPath(uuid), meta.dump());
}

E<Space> FilesystemStorage::getSpace(const std::string& uuid)
{
    auto space = readSpace(metaPath(uuid));
    if(!space.has_value())
    {
        if(space.error().code == ErrorCode::NOT_FOUND)
        {
            return std::unexpected(
                notFound(std::format("Space {} not found", uuid)));
        }
        return space;
    }
    // Hashed directory names are only trusted together with the record.
    if(space->uuid != uuid)
    {
        return std::unexpected(
            notFound(std::format("Space {} not found", uuid)));
    }
    return space;
}

E<void> FilesystemStorage::deleteSpace(const std::string& uuid)
{
    fs::path trashed = root / TRASH_DIR / generateUuid();
    {
        std::unique_lock guard(space_lock);
        DO_OR_RETURN(getSpace(uuid));
        std::error_code ec;
        // After this rename neither the space nor any of its resources
        // can be reached.
        fs::rename(spaceDir(uuid), trashed, ec);
        if(ec)
        {
            return std::unexpected(backendError(std::format(
                "Failed to delete space {}: {}", uuid, ec.message())));
        }
    }

    std::error_code ec;
    fs::remove_all(trashed, ec);
    if(ec)
    {
        spdlog::warn("Failed to clean up {}: {}", trashed.string(),
                     ec.message());
    }
    return {};
}

E<std::vector<Space>> FilesystemStorage::listSpaces(
    const std::string& controller)
{
    std::vector<Space> result;
    std::error_code ec;
    fs::directory_iterator it(root / SPACES_DIR, ec);
    for(; !ec && it != fs::directory_iterator(); it.increment(ec))
    {
        // Spaces still being created have no record yet, and spaces
        // being deleted may lose theirs at any moment.
        auto space = readSpace(it->path() / META_FILE);
        if(!space.has_value())
        {
            if(space.error().code == ErrorCode::NOT_FOUND)
            {
                continue;
            }
            return std::unexpected(space.error());
        }
        if(space->controller == controller)
        {
            result.push_back(*std::move(space));
        }
    }
    if(ec)
    {
        return std::unexpected(ioError("list", root / SPACES_DIR));
    }
    std::sort(result.begin(), result.end(),
              [](const Space& a, const Space& b) { return a.uuid < b.uuid; });
    return result;
}

E<void> FilesystemStorage::putResource(const std::string& space_uuid,
                                       const std::string& path,
                                       const std::string& content,
                                       const std::string& content_type)
{
    // Held until the rename, so that the space cannot be deleted and
    // recreated between the check and the write.
    std::shared_lock guard(space_lock);
    DO_OR_RETURN(getSpace(space_uuid));

    nlohmann::json meta = {{"path", path}, {"content_type", content_type}};
    std::string record = meta.dump();
    record += '\n';
    record += content;
    return atomicWrite(resourcePath(space_uuid, path), record);
}

E<Resource> FilesystemStorage::getResource(const std::string& space_uuid,
                                           const std::string& path)
{
    std::shared_lock guard(space_lock);
    DO_OR_RETURN(getSpace(space_uuid));
    auto record = readFile(resourcePath(space_uuid, path));
    if(!record.has_value())
    {
        if(record.error().code == ErrorCode::NOT_FOUND)
        {
            return std::unexpected(notFound(std::format(
                "Resource {} not found in space {}", path, space_uuid)));
        }
        return std::unexpected(record.error());
    }

    size_t newline = record->find('\n');
    if(newline == std::string::npos)
    {
        return std::unexpected(backendError(
            std::format("Corrupted resource record {}", path)));
    }
    Resource res;
    res.space_uuid = space_uuid;
    res.path = path;
    try
    {
        auto meta = nlohmann::json::parse(record->substr(0, newline));
        res.content_type = meta.at("content_type").get<std::string>();
        if(meta.at("path").get<std::string>() != path)
        {
            return std::unexpected(notFound(std::format(
                "Resource {} not found in space {}", path, space_uuid)));
        }
    }
    catch(const nlohmann::json::exception& e)
    {
        return std::unexpected(backendError(std::format(
            "Corrupted resource record {}: {}", path, e.what())));
    }
    res.content = record->substr(newline + 1);
    return res;
}

E<void> FilesystemStorage::deleteResource(const std::string& space_uuid,
                                          const std::string& path)
{
    std::shared_lock guard(space_lock);
    DO_OR_RETURN(getSpace(space_uuid));
    std::error_code ec;
    fs::remove(resourcePath(space_uuid, path), ec);
    if(ec)
    {
        return std::unexpected(backendError(std::format(
            "Failed to delete resource {}: {}", path, ec.message())));
    }
    return {};
}
