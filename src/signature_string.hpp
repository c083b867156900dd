#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <httplib.h>

#include "error.hpp"

constexpr char REQUEST_TARGET_HEADER[] = "(request-target)";
constexpr char CREATED_HEADER[] = "(created)";
constexpr char EXPIRES_HEADER[] = "(expires)";
constexpr char KEY_ID_HEADER[] = "(key-id)";
// Signed when the signature does not name its headers.
constexpr char DEFAULT_SIGNED_HEADER[] = "date";

// Values of the pseudo-headers that come from the signature itself
// rather than from the request.
struct SignatureParams
{
    std::optional<std::string> key_id;
    std::optional<int64_t> created;
    std::optional<int64_t> expires;
};

// Build the string a client signs: one “name: value” line per signed
// header, in order, joined by “\n” without a trailing newline. Header
// lookup is case-insensitive. An empty “signed_headers” means “date”.
E<std::string> buildSignatureString(
    std::string_view method, std::string_view path,
    const httplib::Headers& headers,
    const std::vector<std::string>& signed_headers,
    const SignatureParams& params = {});
