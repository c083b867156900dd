#include "storage_memory.hpp"

#include <format>
#include <mutex>

namespace {

Error spaceNotFound(const std::string& uuid)
{
    return notFound(std::format("Space {} not found", uuid));
}

} // namespace

E<void> MemoryStorage::init()
{
    return {};
}

E<void> MemoryStorage::putSpace(const std::string& uuid, const std::string& id,
                                const std::string& controller)
{
    std::unique_lock guard(lock);
    auto it = spaces.find(uuid);
    if(it != spaces.end())
    {
        it->second.space.controller = controller;
        return {};
    }
    StoredSpace stored;
    stored.space = Space{uuid, id, controller};
    spaces.emplace(uuid, std::move(stored));
    return {};
}

E<Space> MemoryStorage::getSpace(const std::string& uuid)
{
    std::shared_lock guard(lock);
    auto it = spaces.find(uuid);
    if(it == spaces.end())
    {
        return std::unexpected(spaceNotFound(uuid));
    }
    return it->second.space;
}

E<void> MemoryStorage::deleteSpace(const std::string& uuid)
{
    std::unique_lock guard(lock);
    if(spaces.erase(uuid) == 0)
    {
        return std::unexpected(spaceNotFound(uuid));
    }
    return {};
}

E<std::vector<Space>> MemoryStorage::listSpaces(const std::string& controller)
{
    std::shared_lock guard(lock);
    std::vector<Space> result;
    for(const auto& [uuid, stored] : spaces)
    {
        if(stored.space.controller == controller)
        {
            result.push_back(stored.space);
        }
    }
    return result;
}

E<void> MemoryStorage::putResource(const std::string& space_uuid,
                                   const std::string& path,
                                   const std::string& content,
                                   const std::string& content_type)
{
    std::unique_lock guard(lock);
    auto it = spaces.find(space_uuid);
    if(it == spaces.end())
    {
        return std::unexpected(spaceNotFound(space_uuid));
    }
    it->second.resources.insert_or_assign(
        path, Resource{space_uuid, path, content, content_type});
    return {};
}

E<Resource> MemoryStorage::getResource(const std::string& space_uuid,
                                       const std::string& path)
{
    std::shared_lock guard(lock);
    auto it = spaces.find(space_uuid);
    if(it == spaces.end())
    {
        return std::unexpected(spaceNotFound(space_uuid));
    }
    auto res = it->second.resources.find(path);
    if(res == it->second.resources.end())
    {
        return std::unexpected(notFound(
            std::format("Resource {} not found in space {}", path,
                        space_uuid)));
    }
    return res->second;
}

E<void> MemoryStorage::deleteResource(const std::string& space_uuid,
                                      const std::string& path)
{
    std::unique_lock guard(lock);
    auto it = spaces.find(space_uuid);
    if(it == spaces.end())
    {
        return std::unexpected(spaceNotFound(space_uuid));
    }
    it->second.resources.erase(path);
    return {};
}
