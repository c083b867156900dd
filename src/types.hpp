#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

using Clock = std::chrono::system_clock;
using Time = Clock::time_point;

struct Space
{
    std::string uuid;
    // “urn:uuid:…”, fixed at creation.
    std::string id;
    // The DID allowed to modify this space.
    std::string controller;

    bool operator==(const Space&) const = default;
};

struct Resource
{
    std::string space_uuid;
    // Opaque key, conventionally starting with “/”.
    std::string path;
    // Raw bytes, possibly empty.
    std::string content;
    std::string content_type;

    bool operator==(const Resource&) const = default;
};

constexpr char URN_UUID_PREFIX[] = "urn:uuid:";

std::string makeUrnUuid(std::string_view uuid);
// Case-insensitive check for “urn:uuid:” followed by a canonical UUID.
bool isUrnUuid(std::string_view value);
// Returns the lowercase UUID part of a “urn:uuid:” string.
std::optional<std::string> parseUrnUuid(std::string_view value);
// A random version 4 UUID in canonical lowercase form.
std::string generateUuid();
