#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include <cryptopp/osrng.h>
#include <cryptopp/xed25519.h>
#include <httplib.h>

#include "crypto.hpp"
#include "did_key.hpp"
#include "signature_string.hpp"
#include "types.hpp"

// The server only ever verifies, so signing lives with the tests.
inline std::string signEd25519(const Ed25519Key& private_key,
                               std::string_view msg)
{
    CryptoPP::AutoSeededRandomPool random;
    CryptoPP::ed25519::Signer signer(private_key.data());
    std::string signature(signer.MaxSignatureLength(), '\0');
    size_t siglen = signer.SignMessage(
        random, reinterpret_cast<const CryptoPP::byte*>(msg.data()),
        msg.size(), reinterpret_cast<CryptoPP::byte*>(signature.data()));
    signature.resize(siglen);
    return signature;
}

// A did:key identity that signs httplib requests the way a wallet
// client does, for use in tests.
class TestSigner
{
public:
    TestSigner()
    {
        keys = crypto.createKeyPair();
        PublicKey pub;
        pub.value = keys.public_key;
        did = encodeDidKey(pub);
    }

    // keyId as clients usually send it, with the key fragment.
    std::string keyId() const
    {
        return std::format("{}#{}", did, did.substr(
                               std::string_view(DID_KEY_PREFIX).size()));
    }

    std::string authorization(
        const httplib::Request& req, Time now = Clock::now(),
        const std::vector<std::string>& headers = {
            "(request-target)", "(created)", "(expires)", "(key-id)"})
    {
        const int64_t created = std::chrono::duration_cast<
            std::chrono::seconds>(now.time_since_epoch()).count();
        SignatureParams params;
        params.key_id = keyId();
        params.created = created;
        params.expires = created + 300;

        std::string to_sign = buildSignatureString(
            req.method, req.path, req.headers, headers, params).value();
        std::string joined;
        for(const auto& h : headers)
        {
            if(!joined.empty()) joined += " ";
            joined += h;
        }
        return std::format(
            R"(Signature keyId="{}",headers="{}",signature="{}",created={},expires={})",
            keyId(), joined,
            base64UrlEncode(signEd25519(keys.private_key, to_sign)),
            created, created + 300);
    }

    void sign(httplib::Request& req, Time now = Clock::now())
    {
        req.set_header("Authorization", authorization(req, now));
    }

    KeyPair keys;
    std::string did;

private:
    Crypto crypto;
};
