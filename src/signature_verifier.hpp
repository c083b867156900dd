#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <httplib.h>

#include "error.hpp"
#include "types.hpp"

struct ParsedSignature
{
    std::string key_id;
    std::optional<std::string> algorithm;
    // Lowercased, in signing order. Empty if the client did not say.
    std::vector<std::string> signed_headers;
    std::string signature;
    std::optional<int64_t> created;
    std::optional<int64_t> expires;

    // The DID in keyId, without the key fragment.
    std::string signer() const;
};

// Parse the parameters of a Cavage signature, with or without the
// leading “Signature ” authorization scheme.
E<ParsedSignature> parseSignatureHeader(std::string_view header);

class SignatureVerifier
{
public:
    explicit SignatureVerifier(
        std::chrono::seconds clock_skew = std::chrono::seconds(60));

    // Verifies the signature carried by the request, either in
    // “Authorization: Signature …” or in a “Signature” header.
    // Returns the DID of the signer on success.
    E<std::string> verify(const httplib::Request& req,
                          Time now = Clock::now()) const;

    E<std::string> verify(std::string_view header, std::string_view method,
                          std::string_view path,
                          const httplib::Headers& headers,
                          Time now = Clock::now()) const;

private:
    std::chrono::seconds clock_skew;
};
