#pragma once

#include <string>
#include <string_view>

#include "crypto.hpp"
#include "error.hpp"

constexpr char DID_KEY_PREFIX[] = "did:key:";
// Multicodec code of an Ed25519 public key.
constexpr unsigned int MULTICODEC_ED25519_PUB = 0xed;

struct PublicKey
{
    enum Curve { ED25519 };

    Curve curve = ED25519;
    Ed25519Key value;
};

// Drop the “#fragment” key reference, if any.
std::string_view stripDidFragment(std::string_view did);

// Decode “did:key:z…” (optionally with a fragment) into the raw Ed25519
// key it encodes. Fails with MALFORMED_DID or UNSUPPORTED_KEY_TYPE.
E<PublicKey> resolveDidKey(std::string_view did);

// The inverse of resolveDidKey().
std::string encodeDidKey(const PublicKey& key);
