#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include <cryptopp/osrng.h>

constexpr size_t ED25519_KEY_LENGTH = 32;
constexpr size_t ED25519_SIGNATURE_LENGTH = 64;

using Ed25519Key = std::array<unsigned char, ED25519_KEY_LENGTH>;

// Raw Ed25519 keys, without any ASN.1 wrapping.
struct KeyPair
{
    Ed25519Key public_key;
    Ed25519Key private_key;
};

// Standard base64 without line breaks.
std::string base64Encode(std::string_view data);
// URL-safe base64 without padding.
std::string base64UrlEncode(std::string_view data);
// Accepts both the standard and the URL-safe alphabet, padded or
// not. Returns nullopt on any character outside the alphabet.
std::optional<std::string> base64Decode(std::string_view data);

// Lowercase hex.
std::string sha256Hex(std::string_view data);

bool verifyEd25519(const Ed25519Key& public_key, std::string_view msg,
                   std::string_view signature);

class Crypto
{
public:
    KeyPair createKeyPair();

private:
    CryptoPP::AutoSeededRandomPool random;
};
