#include "identity.hpp"

#include "errors.hpp"

namespace betme {

void requireCaller(const Identity& caller, const Identity& expected, const std::string& reason) {
    if (caller.empty() || caller != expected) {
        throw AuthorizationError(reason);
    }
}

void requireMember(const Identity& caller,
                   const Identity& first,
                   const Identity& second,
                   const std::string& reason) {
    if (caller.empty() || (caller != first && caller != second)) {
        throw AuthorizationError(reason);
    }
}

} // namespace betme
