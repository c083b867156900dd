#include "error.hpp"

#include <format>

Error fromMwError(const mw::Error& e)
{
    return backendError(mw::errorMsg(e));
}

std::string_view errorName(ErrorCode code)
{
    switch(code)
    {
    case ErrorCode::MALFORMED_DID:
        return "MalformedDID";
    case ErrorCode::UNSUPPORTED_KEY_TYPE:
        return "UnsupportedKeyType";
    case ErrorCode::MALFORMED_SIGNATURE_HEADER:
        return "MalformedSignatureHeader";
    case ErrorCode::MISSING_SIGNED_HEADER:
        return "MissingSignedHeader";
    case ErrorCode::UNSUPPORTED_ALGORITHM:
        return "UnsupportedAlgorithm";
    case ErrorCode::INVALID_SIGNATURE:
        return "InvalidSignature";
    case ErrorCode::SIGNATURE_EXPIRED:
        return "SignatureExpired";
    case ErrorCode::UNAUTHENTICATED:
        return "Unauthenticated";
    case ErrorCode::FORBIDDEN:
        return "Forbidden";
    case ErrorCode::NOT_FOUND:
        return "NotFound";
    case ErrorCode::INVALID_REQUEST:
        return "InvalidRequest";
    case ErrorCode::BACKEND_UNAVAILABLE:
        return "BackendUnavailable";
    }
    return "Unknown";
}

int httpStatus(ErrorCode code)
{
    switch(code)
    {
    case ErrorCode::MALFORMED_DID:
    case ErrorCode::UNSUPPORTED_KEY_TYPE:
    case ErrorCode::MALFORMED_SIGNATURE_HEADER:
    case ErrorCode::MISSING_SIGNED_HEADER:
    case ErrorCode::UNSUPPORTED_ALGORITHM:
    case ErrorCode::INVALID_REQUEST:
        return 400;
    case ErrorCode::UNAUTHENTICATED:
    case ErrorCode::INVALID_SIGNATURE:
    case ErrorCode::SIGNATURE_EXPIRED:
        return 401;
    case ErrorCode::FORBIDDEN:
        return 403;
    case ErrorCode::NOT_FOUND:
        return 404;
    case ErrorCode::BACKEND_UNAVAILABLE:
        return 503;
    }
    return 500;
}

std::string errorMsg(const Error& e)
{
    return std::format("{}: {}", errorName(e.code), e.msg);
}
