#pragma once
// PlaybackClock.hpp - Elapsed playback time that freezes while paused

#include <functional>
#include "util/Types.hpp"

namespace lrc {

class PlaybackClock {
public:
    // Monotonic milliseconds from an arbitrary origin
    using TimeSource = std::function<i64()>;

    PlaybackClock();
    explicit PlaybackClock(TimeSource now);

    void start();
    void pause();
    void resume();
    void stop();

    i64 elapsedMs() const;

    bool isRunning() const {
        return state_ == State::Running;
    }
    bool isPaused() const {
        return state_ == State::Paused;
    }

private:
    enum class State { Stopped, Running, Paused };

    TimeSource now_;
    State state_{State::Stopped};
    i64 startedAt_{0};
    i64 pausedAt_{0};
    i64 pausedTotal_{0};
};

} // namespace lrc
