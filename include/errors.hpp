#pragma once

#include <stdexcept>
#include <string>

namespace betme {

enum class ErrorKind {
    AUTHORIZATION,
    STATE,
    VALIDATION,
    INVARIANT
};

const char* errorKindName(ErrorKind kind);

// Every contract failure aborts the call before any state is mutated.
class ContractError : public std::runtime_error {
public:
    ContractError(ErrorKind kind, const std::string& reason)
        : std::runtime_error(reason), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class AuthorizationError : public ContractError {
public:
    explicit AuthorizationError(const std::string& reason)
        : ContractError(ErrorKind::AUTHORIZATION, reason) {}
};

class StateError : public ContractError {
public:
    explicit StateError(const std::string& reason)
        : ContractError(ErrorKind::STATE, reason) {}
};

class ValidationError : public ContractError {
public:
    explicit ValidationError(const std::string& reason)
        : ContractError(ErrorKind::VALIDATION, reason) {}
};

class InvariantError : public ContractError {
public:
    explicit InvariantError(const std::string& reason)
        : ContractError(ErrorKind::INVARIANT, reason) {}
};

} // namespace betme
