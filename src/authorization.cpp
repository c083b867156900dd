#include "authorization.hpp"

#include <format>

#include <spdlog/spdlog.h>

bool requiresSignature(Operation op)
{
    return op != Operation::RESOURCE_GET;
}

E<AuthDecision> Authorizer::authorize(
    Operation op, const std::optional<std::string>& signer,
    const std::string& space_uuid) const
{
    if(!requiresSignature(op))
    {
        return AuthDecision{};
    }
    if(!signer.has_value())
    {
        return std::unexpected(makeError(ErrorCode::UNAUTHENTICATED,
                                         "Request is not signed"));
    }
    if(op == Operation::SPACE_LIST)
    {
        // Filtering by controller happens in the query.
        return AuthDecision{};
    }

    E<Space> space = storage.getSpace(space_uuid);
    if(!space.has_value())
    {
        if(op == Operation::SPACE_PUT &&
           space.error().code == ErrorCode::NOT_FOUND)
        {
            return AuthDecision{true, std::nullopt};
        }
        return std::unexpected(space.error());
    }

    if(space->controller != *signer)
    {
        spdlog::debug("{} is not the controller of space {}", *signer,
                      space_uuid);
        return std::unexpected(makeError(
            ErrorCode::FORBIDDEN,
            std::format("Signer is not the controller of space {}",
                        space_uuid)));
    }
    return AuthDecision{false, *std::move(space)};
}
