#pragma once

#include <cstdint>

namespace betme {

class Clock {
public:
    virtual ~Clock() = default;
    // Unix seconds.
    virtual std::uint64_t now() const = 0;
};

class SystemClock : public Clock {
public:
    std::uint64_t now() const override;
};

class ManualClock : public Clock {
public:
    explicit ManualClock(std::uint64_t start = 0) : now_(start) {}

    std::uint64_t now() const override { return now_; }
    void set(std::uint64_t timestamp);
    void advance(std::uint64_t seconds);

private:
    std::uint64_t now_;
};

} // namespace betme
