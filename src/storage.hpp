#pragma once

#include <string>
#include <vector>

#include "error.hpp"
#include "types.hpp"

// Every backend keeps the same guarantees regardless of medium:
//
// - Writes are atomic. A reader sees either the old or the new space
//   record, and either the old or the new (content, content type)
//   pair of a resource, never a mixture.
// - Any operation on a space that does not exist, other than the
//   creating putSpace(), fails with NOT_FOUND.
// - deleteSpace() removes the space and all of its resources as one
//   logical operation.
// - Media failures are reported as BACKEND_UNAVAILABLE.
class StorageInterface
{
public:
    virtual ~StorageInterface() = default;
    virtual E<void> init() = 0;

    // Space DAO
    //
    // Create the space, or overwrite the controller of an existing
    // one. The id of an existing space is kept.
    virtual E<void> putSpace(const std::string& uuid, const std::string& id,
                             const std::string& controller) = 0;
    virtual E<Space> getSpace(const std::string& uuid) = 0;
    virtual E<void> deleteSpace(const std::string& uuid) = 0;
    // All spaces controlled by “controller”, ordered by UUID.
    virtual E<std::vector<Space>> listSpaces(const std::string& controller) = 0;

    // Resource DAO
    virtual E<void> putResource(const std::string& space_uuid,
                                const std::string& path,
                                const std::string& content,
                                const std::string& content_type) = 0;
    virtual E<Resource> getResource(const std::string& space_uuid,
                                    const std::string& path) = 0;
    // Succeeds whether or not the resource exists.
    virtual E<void> deleteResource(const std::string& space_uuid,
                                   const std::string& path) = 0;
};
