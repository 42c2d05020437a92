#pragma once

#include <string>

namespace betme {

// Rejects nested entry into a contract while one of its operations is running.
class ReentrancyGuard {
public:
    class Scope {
    public:
        Scope(ReentrancyGuard& guard, const std::string& operation);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ReentrancyGuard& guard_;
    };

    bool entered() const { return entered_; }

private:
    bool entered_ = false;
};

} // namespace betme
