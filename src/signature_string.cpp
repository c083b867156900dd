#include "signature_string.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace {

std::string toLower(std::string_view s)
{
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

E<std::string> pseudoHeaderValue(const std::string& name,
                                 std::string_view method,
                                 std::string_view path,
                                 const SignatureParams& params)
{
    if(name == REQUEST_TARGET_HEADER)
    {
        return std::format("{} {}", toLower(method), path);
    }
    if(name == CREATED_HEADER && params.created.has_value())
    {
        return std::to_string(*params.created);
    }
    if(name == EXPIRES_HEADER && params.expires.has_value())
    {
        return std::to_string(*params.expires);
    }
    if(name == KEY_ID_HEADER && params.key_id.has_value())
    {
        return *params.key_id;
    }
    return std::unexpected(makeError(
        ErrorCode::MISSING_SIGNED_HEADER,
        std::format("No value for signed pseudo-header {}", name)));
}

} // namespace

E<std::string> buildSignatureString(
    std::string_view method, std::string_view path,
    const httplib::Headers& headers,
    const std::vector<std::string>& signed_headers,
    const SignatureParams& params)
{
    std::vector<std::string> names = signed_headers;
    if(names.empty())
    {
        names.push_back(DEFAULT_SIGNED_HEADER);
    }

    std::string result;
    bool first = true;
    for(const std::string& raw_name : names)
    {
        const std::string name = toLower(raw_name);
        std::string value;
        if(name.starts_with("("))
        {
            ASSIGN_OR_RETURN(value,
                             pseudoHeaderValue(name, method, path, params));
        }
        else
        {
            auto [begin, end] = headers.equal_range(name);
            if(begin == end)
            {
                return std::unexpected(makeError(
                    ErrorCode::MISSING_SIGNED_HEADER,
                    std::format("Signed header {} is not in the request",
                                name)));
            }
            for(auto it = begin; it != end; it++)
            {
                if(it != begin)
                {
                    value += ", ";
                }
                value += it->second;
            }
        }

        if(!first)
        {
            result += "\n";
        }
        first = false;
        result += std::format("{}: {}", name, value);
    }
    return result;
}
