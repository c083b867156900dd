#include "types.hpp"

#include <array>
#include <cctype>
#include <format>

#include <cryptopp/osrng.h>

namespace {

bool isCanonicalUuid(std::string_view s)
{
    if(s.size() != 36)
    {
        return false;
    }
    for(size_t i = 0; i < s.size(); i++)
    {
        if(i == 8 || i == 13 || i == 18 || i == 23)
        {
            if(s[i] != '-')
            {
                return false;
            }
        }
        else if(!std::isxdigit(static_cast<unsigned char>(s[i])))
        {
            return false;
        }
    }
    return true;
}

} // namespace

std::string makeUrnUuid(std::string_view uuid)
{
    return std::format("{}{}", URN_UUID_PREFIX, uuid);
}

bool isUrnUuid(std::string_view value)
{
    const std::string_view prefix = URN_UUID_PREFIX;
    if(value.size() < prefix.size())
    {
        return false;
    }
    for(size_t i = 0; i < prefix.size(); i++)
    {
        if(std::tolower(static_cast<unsigned char>(value[i])) != prefix[i])
        {
            return false;
        }
    }
    return isCanonicalUuid(value.substr(prefix.size()));
}

std::optional<std::string> parseUrnUuid(std::string_view value)
{
    if(!isUrnUuid(value))
    {
        return std::nullopt;
    }
    std::string uuid(value.substr(std::string_view(URN_UUID_PREFIX).size()));
    for(char& c : uuid)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return uuid;
}

std::string generateUuid()
{
    CryptoPP::AutoSeededRandomPool random;
    std::array<CryptoPP::byte, 16> bytes;
    random.GenerateBlock(bytes.data(), bytes.size());
    // Version 4, RFC 4122 variant.
    bytes[6] = (bytes[6] & 0x0f) | 0x40;
    bytes[8] = (bytes[8] & 0x3f) | 0x80;

    std::string result;
    for(size_t i = 0; i < bytes.size(); i++)
    {
        if(i == 4 || i == 6 || i == 8 || i == 10)
        {
            result += '-';
        }
        result += std::format("{:02x}", bytes[i]);
    }
    return result;
}
