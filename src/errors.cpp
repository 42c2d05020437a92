#include "errors.hpp"

namespace betme {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::AUTHORIZATION:
        return "authorization";
    case ErrorKind::STATE:
        return "state";
    case ErrorKind::VALIDATION:
        return "validation";
    case ErrorKind::INVARIANT:
        return "invariant";
    }
    return "unknown";
}

} // namespace betme
