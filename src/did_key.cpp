#include "did_key.hpp"

#include <algorithm>
#include <cstdint>
#include <format>

#include "base58.hpp"

namespace {

struct Multicodec
{
    uint64_t code;
    // Number of bytes the varint took.
    size_t length;
};

// Unsigned LEB128, as used by multicodec. Codes never exceed 9 bytes.
std::optional<Multicodec> readVarint(std::string_view data)
{
    uint64_t value = 0;
    for(size_t i = 0; i < data.size() && i < 9; i++)
    {
        const auto b = static_cast<uint8_t>(data[i]);
        value |= static_cast<uint64_t>(b & 0x7f) << (7 * i);
        if((b & 0x80) == 0)
        {
            return Multicodec{value, i + 1};
        }
    }
    return std::nullopt;
}

} // namespace

std::string_view stripDidFragment(std::string_view did)
{
    return did.substr(0, did.find('#'));
}

E<PublicKey> resolveDidKey(std::string_view did)
{
    did = stripDidFragment(did);
    const std::string_view prefix = DID_KEY_PREFIX;
    if(!did.starts_with(prefix))
    {
        return std::unexpected(makeError(
            ErrorCode::MALFORMED_DID,
            std::format("Expected a did:key identifier, got {}", did)));
    }
    std::string_view multibase = did.substr(prefix.size());
    if(multibase.empty() || multibase[0] != 'z')
    {
        return std::unexpected(makeError(
            ErrorCode::MALFORMED_DID,
            "Only base58btc (“z”) multibase keys are supported"));
    }

    std::optional<std::string> decoded = base58Decode(multibase.substr(1));
    if(!decoded.has_value())
    {
        return std::unexpected(makeError(
            ErrorCode::MALFORMED_DID, "Invalid base58 in did:key"));
    }
    std::optional<Multicodec> codec = readVarint(*decoded);
    if(!codec.has_value())
    {
        return std::unexpected(makeError(
            ErrorCode::MALFORMED_DID, "Truncated multicodec prefix"));
    }
    if(codec->code != MULTICODEC_ED25519_PUB)
    {
        return std::unexpected(makeError(
            ErrorCode::UNSUPPORTED_KEY_TYPE,
            std::format("Unsupported multicodec key type 0x{:x}",
                        codec->code)));
    }

    std::string_view raw = std::string_view(*decoded).substr(codec->length);
    if(raw.size() != ED25519_KEY_LENGTH)
    {
        return std::unexpected(makeError(
            ErrorCode::MALFORMED_DID,
            std::format("Expected a {}-byte Ed25519 key, got {} bytes",
                        ED25519_KEY_LENGTH, raw.size())));
    }

    PublicKey key;
    std::copy(raw.begin(), raw.end(), key.value.begin());
    return key;
}

std::string encodeDidKey(const PublicKey& key)
{
    std::string payload;
    payload += static_cast<char>(0xed);
    payload += static_cast<char>(0x01);
    payload.append(reinterpret_cast<const char*>(key.value.data()),
                   key.value.size());
    return std::format("{}z{}", DID_KEY_PREFIX, base58Encode(payload));
}
