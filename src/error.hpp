#pragma once

#include <expected>
#include <string>
#include <string_view>

#include <mw/error.hpp>

enum class ErrorCode
{
    MALFORMED_DID,
    UNSUPPORTED_KEY_TYPE,
    MALFORMED_SIGNATURE_HEADER,
    MISSING_SIGNED_HEADER,
    UNSUPPORTED_ALGORITHM,
    INVALID_SIGNATURE,
    SIGNATURE_EXPIRED,
    UNAUTHENTICATED,
    FORBIDDEN,
    NOT_FOUND,
    INVALID_REQUEST,
    BACKEND_UNAVAILABLE,
};

struct Error
{
    ErrorCode code;
    std::string msg;
};

template<typename T>
using E = std::expected<T, Error>;

inline Error makeError(ErrorCode code, std::string_view msg)
{
    return Error{code, std::string(msg)};
}

inline Error notFound(std::string_view msg)
{
    return makeError(ErrorCode::NOT_FOUND, msg);
}

inline Error backendError(std::string_view msg)
{
    return makeError(ErrorCode::BACKEND_UNAVAILABLE, msg);
}

// Wrap a failure reported by libmw (SQLite, etc.) as a backend failure.
Error fromMwError(const mw::Error& e);

// Stable name of the error kind, e.g. “NotFound”.
std::string_view errorName(ErrorCode code);
// The fixed HTTP status each error kind maps to.
int httpStatus(ErrorCode code);
std::string errorMsg(const Error& e);
