#pragma once

#include <chrono>
#include <cmath>
#include <optional>

namespace clubnet {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Counts rendered frames over rolling windows of wall-clock time.
/// The host reports each rendered frame; sample(now) closes the window
/// once at least `window` has elapsed and yields the average FPS.
class FpsSampler {
public:
    explicit FpsSampler(std::chrono::milliseconds window = std::chrono::milliseconds(1000))
        : window_(window) {}

    void start(TimePoint now) {
        window_start_ = now;
        frames_ = 0;
        started_ = true;
    }

    void frame() { frames_++; }

    /// Average FPS of the current window if it is complete, computed as
    /// round(frames * 1000 / elapsed_ms). A new window starts at `now`.
    std::optional<double> sample(TimePoint now) {
        if (!started_) {
            start(now);
            return std::nullopt;
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - window_start_);
        if (elapsed < window_ || elapsed.count() <= 0) return std::nullopt;

        last_fps_ = std::round(frames_ * 1000.0 / static_cast<double>(elapsed.count()));
        window_start_ = now;
        frames_ = 0;
        return last_fps_;
    }

    /// Average of the most recently closed window; 60 before the first one.
    double averageFps() const { return last_fps_; }
    int framesInWindow() const { return frames_; }
    bool started() const { return started_; }

private:
    std::chrono::milliseconds window_;
    TimePoint window_start_{};
    int frames_ = 0;
    double last_fps_ = 60.0;
    bool started_ = false;
};

} // namespace clubnet
