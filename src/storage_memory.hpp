#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "storage.hpp"

class MemoryStorage : public StorageInterface
{
public:
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
    struct StoredSpace
    {
        Space space;
        std::map<std::string, Resource> resources;
    };

    std::shared_mutex lock;
    std::map<std::string, StoredSpace> spaces;
};
