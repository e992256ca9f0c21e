#include "pacing.h"

#include <algorithm>
#include <thread>
#include <utility>

// -----------------------------------------------------------------------
// SteadyClock
// -----------------------------------------------------------------------

Clock::TimePoint SteadyClock::now() {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep(Duration d) {
    std::this_thread::sleep_for(d);
}

// -----------------------------------------------------------------------
// PacingGate
// -----------------------------------------------------------------------

PacingGate::PacingGate(std::shared_ptr<PacingState> state, std::shared_ptr<Clock> clock,
                       double pause_seconds)
    : _state(std::move(state)), _clock(std::move(clock)), _pause(pause_seconds) {}

void PacingGate::wait() {
    // A fresh state has no previous frame, so the first command never waits.
    double seconds = std::max(_pause, _state->min_pause);
    if (!_state->last_sent || seconds <= 0.0) return;

    auto pause   = std::chrono::duration_cast<Clock::Duration>(
        std::chrono::duration<double>(seconds));
    auto elapsed = _clock->now() - *_state->last_sent;
    if (elapsed < pause)
        _clock->sleep(pause - elapsed);
}

void PacingGate::mark_sent() {
    _state->last_sent = _clock->now();
}
