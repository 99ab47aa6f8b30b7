#include "PlaybackClock.hpp"
#include <QElapsedTimer>
#include <memory>

namespace lrc {

PlaybackClock::PlaybackClock() {
    auto timer = std::make_shared<QElapsedTimer>();
    timer->start();
    now_ = [timer] { return static_cast<i64>(timer->elapsed()); };
}

PlaybackClock::PlaybackClock(TimeSource now) : now_(std::move(now)) {}

void PlaybackClock::start() {
    startedAt_ = now_();
    pausedTotal_ = 0;
    state_ = State::Running;
}

void PlaybackClock::pause() {
    if (state_ != State::Running)
        return;
    pausedAt_ = now_();
    state_ = State::Paused;
}

void PlaybackClock::resume() {
    if (state_ != State::Paused)
        return;
    pausedTotal_ += now_() - pausedAt_;
    state_ = State::Running;
}

void PlaybackClock::stop() {
    state_ = State::Stopped;
    pausedTotal_ = 0;
}

i64 PlaybackClock::elapsedMs() const {
    switch (state_) {
    case State::Running:
        return now_() - startedAt_ - pausedTotal_;
    case State::Paused:
        return pausedAt_ - startedAt_ - pausedTotal_;
    case State::Stopped:
        break;
    }
    return 0;
}

} // namespace lrc
