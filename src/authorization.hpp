#pragma once

#include <optional>
#include <string>

#include "error.hpp"
#include "storage.hpp"
#include "types.hpp"

enum class Operation
{
    SPACE_PUT,
    SPACE_GET,
    SPACE_DELETE,
    SPACE_LIST,
    RESOURCE_GET,
    RESOURCE_PUT,
    RESOURCE_DELETE,
};

struct AuthDecision
{
    // True when a space upsert targets a space that does not exist yet,
    // in which case the signer becomes its controller.
    bool creating = false;
    // The target space, when the decision had to load it.
    std::optional<Space> space;
};

// Decides whether a verified signer may perform an operation on a
// space. It holds no state of its own besides the storage it reads.
class Authorizer
{
public:
    explicit Authorizer(StorageInterface& storage) : storage(storage) {}

    // “signer” is the DID returned by signature verification, or empty
    // when the request carried no signature. Only resource reads are
    // allowed without one.
    E<AuthDecision> authorize(Operation op,
                              const std::optional<std::string>& signer,
                              const std::string& space_uuid) const;

private:
    StorageInterface& storage;
};

bool requiresSignature(Operation op);
