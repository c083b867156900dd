#pragma once

#include <filesystem>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "storage.hpp"

// Persists spaces and resources under a root directory:
//
//     {root}/spaces/s{space}/space.json
//     {root}/spaces/s{space}/resources/r{path}
//     {root}/trash/
//
// Space UUIDs and resource paths are percent-encoded into file names.
// Names that would be too long are replaced by “h” and their SHA-256,
// and the records keep the real UUID or path.
// A resource file holds one line of JSON metadata followed by the raw
// content, so that content and content type are replaced together by
// a single rename.
class FilesystemStorage : public StorageInterface
{
public:
    explicit FilesystemStorage(const std::string& root_dir);
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

    // Percent-encode everything but [A-Za-z0-9_~-]. The result never
    // contains a dot, which keeps it clear of temporary file names.
    static std::string encodeName(std::string_view name);
    // The file name used for “name”: “kind” followed by its encoding,
    // or a digest.
    static std::string fileName(char kind, std::string_view name);

private:
    std::filesystem::path spaceDir(const std::string& uuid) const;
    std::filesystem::path metaPath(const std::string& uuid) const;
    std::filesystem::path resourcePath(const std::string& space_uuid,
                                       const std::string& path) const;
    E<Space> readSpace(const std::filesystem::path& meta_path) const;

    std::filesystem::path root;
    // Exclusive for creating, updating and deleting spaces. Shared by
    // resource operations, which must not overlap a space deletion.
    std::shared_mutex space_lock;
};
