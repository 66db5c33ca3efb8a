#pragma once
#include <chrono>
#include <optional>

namespace util
{

using Clock = std::chrono::steady_clock;

// Absolute expiry for one in-flight action. A default Deadline never expires.
class Deadline
{
  public:
    Deadline() = default;

    static Deadline after(std::chrono::milliseconds timeout)
    {
        Deadline d;
        d.at_ = Clock::now() + timeout;
        return d;
    }
    static Deadline never() { return Deadline{}; }

    bool expired(Clock::time_point now = Clock::now()) const { return at_ && now > *at_; }
    bool has_expiry() const { return at_.has_value(); }

    std::optional<Clock::time_point> at() const { return at_; }

  private:
    std::optional<Clock::time_point> at_{};
};

}  // namespace util
