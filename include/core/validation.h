#pragma once

#include "core/identity.h"
#include <string>
#include <functional>
#include <optional>
#include <cstdint>

namespace sigelnet {
namespace core {

enum class RejectReason : uint8_t {
    NONE = 0,
    STALE_INDEX = 1,
    HASH_MISMATCH = 2,
    DIFFICULTY_NOT_MET = 3,
    INVALID_TRANSACTION = 4,
    NON_MONOTONIC_TIMESTAMP = 5
};

const char* rejectReasonToString(RejectReason reason);

// Answers whether an identity id is known to this node.
using IdentityLookup = std::function<bool(const std::string&)>;

// Returns a copy of the identity's record, or nullopt when it is unknown.
using IdentityResolver = std::function<std::optional<IdentityRecord>(const std::string&)>;

}
}
