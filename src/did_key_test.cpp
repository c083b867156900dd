#include <string>

#include <gtest/gtest.h>

#include "base58.hpp"
#include "crypto.hpp"
#include "did_key.hpp"

namespace {

std::string didFromPayload(const std::string& payload)
{
    return std::string(DID_KEY_PREFIX) + "z" + base58Encode(payload);
}

PublicKey sampleKey()
{
    PublicKey key;
    for(size_t i = 0; i < key.value.size(); i++)
    {
        key.value[i] = static_cast<unsigned char>(i * 7 + 3);
    }
    return key;
}

} // namespace

TEST(DidKeyTest, EncodeAndResolve)
{
    PublicKey key = sampleKey();
    std::string did = encodeDidKey(key);
    // Every Ed25519 did:key shares this prefix.
    EXPECT_TRUE(did.starts_with("did:key:z6Mk")) << did;

    auto resolved = resolveDidKey(did);
    ASSERT_TRUE(resolved.has_value()) << errorMsg(resolved.error());
    EXPECT_EQ(resolved->curve, PublicKey::ED25519);
    EXPECT_EQ(resolved->value, key.value);
}

TEST(DidKeyTest, ResolveWithFragment)
{
    PublicKey key = sampleKey();
    std::string did = encodeDidKey(key);
    std::string key_id = did + "#" + did.substr(8);
    EXPECT_EQ(stripDidFragment(key_id), did);

    auto resolved = resolveDidKey(key_id);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->value, key.value);
}

TEST(DidKeyTest, ResolveGeneratedKey)
{
    Crypto c;
    KeyPair keys = c.createKeyPair();
    PublicKey pub;
    pub.value = keys.public_key;
    auto resolved = resolveDidKey(encodeDidKey(pub));
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->value, keys.public_key);
}

TEST(DidKeyTest, MalformedDid)
{
    EXPECT_EQ(resolveDidKey("did:web:example.com").error().code,
              ErrorCode::MALFORMED_DID);
    EXPECT_EQ(resolveDidKey("did:key:").error().code,
              ErrorCode::MALFORMED_DID);
    // Not base58btc
    EXPECT_EQ(resolveDidKey("did:key:f6Mkabc").error().code,
              ErrorCode::MALFORMED_DID);
    EXPECT_EQ(resolveDidKey("did:key:z6Mk0OIl").error().code,
              ErrorCode::MALFORMED_DID);
    EXPECT_EQ(resolveDidKey("https://example.com/key").error().code,
              ErrorCode::MALFORMED_DID);
}

TEST(DidKeyTest, WrongKeyLength)
{
    std::string payload("\xed\x01", 2);
    payload += std::string(31, 'k');
    EXPECT_EQ(resolveDidKey(didFromPayload(payload)).error().code,
              ErrorCode::MALFORMED_DID);

    payload += "kk";
    EXPECT_EQ(resolveDidKey(didFromPayload(payload)).error().code,
              ErrorCode::MALFORMED_DID);
}

TEST(DidKeyTest, UnsupportedKeyType)
{
    // secp256k1-pub, 0xe7
    std::string payload("\xe7\x01", 2);
    payload += std::string(33, '\x02');
    EXPECT_EQ(resolveDidKey(didFromPayload(payload)).error().code,
              ErrorCode::UNSUPPORTED_KEY_TYPE);

    // x25519-pub, 0xec
    payload = std::string("\xec\x01", 2) + std::string(32, 'x');
    EXPECT_EQ(resolveDidKey(didFromPayload(payload)).error().code,
              ErrorCode::UNSUPPORTED_KEY_TYPE);
}
