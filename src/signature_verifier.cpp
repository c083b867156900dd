#include "signature_verifier.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <sstream>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "crypto.hpp"
#include "did_key.hpp"
#include "http_utils.hpp"
#include "signature_string.hpp"

namespace {

constexpr char SIGNATURE_SCHEME[] = "signature";

std::unordered_map<std::string, std::string>
tokenizeSignatureParams(std::string_view header)
{
    std::unordered_map<std::string, std::string> params;
    std::string key, val;
    bool in_quote = false;
    bool parsing_key = true;

    for(char c : header)
    {
        if(parsing_key)
        {
            if(c == '=')
            {
                parsing_key = false;
            }
            else if(c != ' ' && c != ',')
            {
                key += c;
            }
        }
        else
        {
            if(c == '"')
            {
                in_quote = !in_quote;
            }
            else if(c == ',' && !in_quote)
            {
                params[key] = val;
                key.clear();
                val.clear();
                parsing_key = true;
            }
            else if(c != ' ' || in_quote)
            {
                val += c;
            }
        }
    }
    if(!key.empty())
    {
        params[key] = val;
    }
    return params;
}

std::string_view stripScheme(std::string_view header)
{
    while(!header.empty() && header.front() == ' ')
    {
        header.remove_prefix(1);
    }
    const std::string_view scheme = SIGNATURE_SCHEME;
    if(header.size() > scheme.size() && header[scheme.size()] == ' ' &&
       std::equal(scheme.begin(), scheme.end(), header.begin(),
                  [](char a, char b)
                  {
                      return a == std::tolower(static_cast<unsigned char>(b));
                  }))
    {
        header.remove_prefix(scheme.size() + 1);
    }
    return header;
}

E<std::optional<int64_t>> parseTimestamp(
    const std::unordered_map<std::string, std::string>& params,
    const std::string& name)
{
    auto it = params.find(name);
    if(it == params.end())
    {
        return std::nullopt;
    }
    const std::string& s = it->second;
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if(ec != std::errc() || ptr != s.data() + s.size() || s.empty())
    {
        return std::unexpected(makeError(
            ErrorCode::MALFORMED_SIGNATURE_HEADER,
            std::format("Signature parameter {} is not an integer", name)));
    }
    return value;
}

bool isEd25519Algorithm(std::string algo)
{
    std::transform(algo.begin(), algo.end(), algo.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    // hs2019 means “derive the algorithm from the key”, and did:key
    // always gives us an Ed25519 key.
    return algo == "ed25519" || algo == "hs2019";
}

} // namespace

std::string ParsedSignature::signer() const
{
    return std::string(stripDidFragment(key_id));
}

E<ParsedSignature> parseSignatureHeader(std::string_view header)
{
    auto params = tokenizeSignatureParams(stripScheme(header));
    if(!params.contains("keyId") || !params.contains("signature"))
    {
        return std::unexpected(makeError(
            ErrorCode::MALFORMED_SIGNATURE_HEADER,
            "Signature must have keyId and signature parameters"));
    }

    ParsedSignature sig;
    sig.key_id = params["keyId"];
    if(sig.key_id.empty())
    {
        return std::unexpected(makeError(
            ErrorCode::MALFORMED_SIGNATURE_HEADER, "Empty keyId"));
    }
    if(auto it = params.find("algorithm"); it != params.end())
    {
        sig.algorithm = it->second;
    }
    if(auto it = params.find("headers"); it != params.end())
    {
        std::stringstream ss(it->second);
        std::string name;
        while(std::getline(ss, name, ' '))
        {
            if(name.empty())
            {
                continue;
            }
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            sig.signed_headers.push_back(name);
        }
    }

    std::optional<std::string> sig_bytes = base64Decode(params["signature"]);
    if(!sig_bytes.has_value() || sig_bytes->empty())
    {
        return std::unexpected(makeError(
            ErrorCode::MALFORMED_SIGNATURE_HEADER, "Invalid base64 signature"));
    }
    sig.signature = *std::move(sig_bytes);

    ASSIGN_OR_RETURN(sig.created, parseTimestamp(params, "created"));
    ASSIGN_OR_RETURN(sig.expires, parseTimestamp(params, "expires"));
    return sig;
}

SignatureVerifier::SignatureVerifier(std::chrono::seconds clock_skew)
    : clock_skew(clock_skew)
{
}

E<std::string> SignatureVerifier::verify(const httplib::Request& req,
                                         Time now) const
{
    std::string header;
    if(req.has_header("Authorization"))
    {
        header = req.get_header_value("Authorization");
    }
    else if(req.has_header("Signature"))
    {
        header = req.get_header_value("Signature");
    }
    else
    {
        return std::unexpected(makeError(ErrorCode::UNAUTHENTICATED,
                                         "Missing signature"));
    }
    return verify(header, req.method, req.path, req.headers, now);
}

E<std::string> SignatureVerifier::verify(std::string_view header,
                                         std::string_view method,
                                         std::string_view path,
                                         const httplib::Headers& headers,
                                         Time now) const
{
    ASSIGN_OR_RETURN(ParsedSignature sig, parseSignatureHeader(header));

    if(sig.algorithm.has_value() && !isEd25519Algorithm(*sig.algorithm))
    {
        return std::unexpected(makeError(
            ErrorCode::UNSUPPORTED_ALGORITHM,
            std::format("Unsupported signature algorithm {}",
                        *sig.algorithm)));
    }

    const int64_t now_sec = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
    if(sig.expires.has_value() && *sig.expires < now_sec - clock_skew.count())
    {
        return std::unexpected(makeError(ErrorCode::SIGNATURE_EXPIRED,
                                         "Signature has expired"));
    }
    if(sig.created.has_value() && *sig.created > now_sec + clock_skew.count())
    {
        return std::unexpected(makeError(ErrorCode::INVALID_SIGNATURE,
                                         "Signature created in the future"));
    }

    ASSIGN_OR_RETURN(PublicKey key, resolveDidKey(sig.key_id));

    SignatureParams params;
    params.key_id = sig.key_id;
    params.created = sig.created;
    params.expires = sig.expires;
    ASSIGN_OR_RETURN(std::string to_verify,
                     buildSignatureString(method, path, headers,
                                          sig.signed_headers, params));

    const bool date_signed =
        sig.signed_headers.empty() ||
        std::find(sig.signed_headers.begin(), sig.signed_headers.end(),
                  DEFAULT_SIGNED_HEADER) != sig.signed_headers.end();
    if(date_signed)
    {
        auto it = headers.find(DEFAULT_SIGNED_HEADER);
        if(it != headers.end() &&
           !http_utils::checkDateSkew(it->second, clock_skew, now))
        {
            return std::unexpected(makeError(
                ErrorCode::SIGNATURE_EXPIRED, "Date header too skewed"));
        }
    }

    if(!verifyEd25519(key.value, to_verify, sig.signature))
    {
        spdlog::warn("Rejected signature from {} on {} {}", sig.signer(),
                     method, path);
        return std::unexpected(makeError(ErrorCode::INVALID_SIGNATURE,
                                         "Signature verification failed"));
    }
    spdlog::debug("Verified signature from {} on {} {}", sig.signer(),
                  method, path);
    return sig.signer();
}
