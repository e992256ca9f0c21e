#pragma once

#include <chrono>
#include <memory>
#include <optional>

// Monotonic time source. Injected so tests can run the pacing logic without
// real sleeps.
class Clock {
public:
    using Duration  = std::chrono::steady_clock::duration;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() = 0;
    virtual void sleep(Duration d) = 0;
};

// std::chrono::steady_clock + std::this_thread::sleep_for
class SteadyClock : public Clock {
public:
    TimePoint now() override;
    void sleep(Duration d) override;
};

// Time of the last transmitted frame. Shared by every controller in a pool
// so that the minimum spacing holds across gateways.
struct PacingState {
    std::optional<Clock::TimePoint> last_sent;  // empty = nothing sent yet

    // Lower bound on the pause for every gate using this state, in seconds.
    // A pool sets it to the largest pause of its gateways.
    double min_pause = 0.0;
};

// Enforces the minimum pause between two frames. The gateways drop commands
// that arrive less than ~100 ms apart.
class PacingGate {
public:
    PacingGate(std::shared_ptr<PacingState> state, std::shared_ptr<Clock> clock,
               double pause_seconds);

    // Block until at least max(pause, state->min_pause) has elapsed since
    // the last frame.
    void wait();

    // Record that a frame has just been sent (or attempted).
    void mark_sent();

    double pause() const { return _pause; }
    void set_pause(double pause_seconds) { _pause = pause_seconds; }

    const std::shared_ptr<PacingState>& state() const { return _state; }

private:
    std::shared_ptr<PacingState> _state;
    std::shared_ptr<Clock>       _clock;
    double                       _pause;
};
