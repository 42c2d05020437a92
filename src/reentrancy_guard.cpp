#include "reentrancy_guard.hpp"

#include "errors.hpp"

namespace betme {

ReentrancyGuard::Scope::Scope(ReentrancyGuard& guard, const std::string& operation)
    : guard_(guard) {
    if (guard_.entered_) {
        throw StateError("Reentrant call into " + operation);
    }
    guard_.entered_ = true;
}

ReentrancyGuard::Scope::~Scope() {
    guard_.entered_ = false;
}

} // namespace betme
