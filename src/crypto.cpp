#include <algorithm>

#include <cryptopp/base64.h>
#include <cryptopp/cryptlib.h>
#include <cryptopp/filters.h>
#include <cryptopp/hex.h>
#include <cryptopp/sha.h>
#include <cryptopp/xed25519.h>

#include "crypto.hpp"

namespace {

const CryptoPP::byte* bytes(std::string_view s)
{
    return reinterpret_cast<const CryptoPP::byte*>(s.data());
}

} // namespace

std::string base64Encode(std::string_view data)
{
    std::string result;
    CryptoPP::ArraySource src(bytes(data), data.size(), true,
                              new CryptoPP::Base64Encoder(
                                  new CryptoPP::StringSink(result), false));
    return result;
}

std::string base64UrlEncode(std::string_view data)
{
    std::string result;
    CryptoPP::ArraySource src(bytes(data), data.size(), true,
                              new CryptoPP::Base64URLEncoder(
                                  new CryptoPP::StringSink(result), false));
    return result;
}

std::string sha256Hex(std::string_view data)
{
    CryptoPP::SHA256 hash;
    std::string result;
    CryptoPP::ArraySource src(bytes(data), data.size(), true,
                              new CryptoPP::HashFilter(
                                  hash, new CryptoPP::HexEncoder(
                                      new CryptoPP::StringSink(result),
                                      false)));
    return result;
}

std::optional<std::string> base64Decode(std::string_view data)
{
    size_t end = data.size();
    while(end > 0 && data[end - 1] == '=')
    {
        end--;
    }
    if(data.size() - end > 2)
    {
        return std::nullopt;
    }
    std::string_view body = data.substr(0, end);
    // A single trailing character never encodes a whole byte.
    if(body.size() % 4 == 1)
    {
        return std::nullopt;
    }

    bool url_safe = false;
    bool standard = false;
    for(char c : body)
    {
        if((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9'))
        {
            continue;
        }
        if(c == '+' || c == '/')
        {
            standard = true;
        }
        else if(c == '-' || c == '_')
        {
            url_safe = true;
        }
        else
        {
            return std::nullopt;
        }
    }
    if(standard && url_safe)
    {
        return std::nullopt;
    }

    std::string result;
    if(url_safe)
    {
        CryptoPP::ArraySource src(bytes(body), body.size(), true,
                                  new CryptoPP::Base64URLDecoder(
                                      new CryptoPP::StringSink(result)));
    }
    else
    {
        CryptoPP::ArraySource src(bytes(body), body.size(), true,
                                  new CryptoPP::Base64Decoder(
                                      new CryptoPP::StringSink(result)));
    }
    return result;
}

bool verifyEd25519(const Ed25519Key& public_key, std::string_view msg,
                   std::string_view signature)
{
    if(signature.size() != ED25519_SIGNATURE_LENGTH)
    {
        return false;
    }
    CryptoPP::ed25519::Verifier verifier(public_key.data());
    return verifier.VerifyMessage(bytes(msg), msg.size(), bytes(signature),
                                  signature.size());
}

KeyPair Crypto::createKeyPair()
{
    CryptoPP::ed25519::Signer signer;
    signer.AccessPrivateKey().GenerateRandom(random);
    const CryptoPP::ed25519PrivateKey& priv_key =
        dynamic_cast<const CryptoPP::ed25519PrivateKey&>(
            signer.GetPrivateKey());

    KeyPair result;
    std::copy_n(priv_key.GetPrivateKeyBytePtr(), ED25519_KEY_LENGTH,
                result.private_key.begin());
    std::copy_n(priv_key.GetPublicKeyBytePtr(), ED25519_KEY_LENGTH,
                result.public_key.begin());
    return result;
}
