#pragma once

/**
 * @file frame_scheduler.h
 * @brief Continuous draw loop on top of a FrameHost
 *
 * States:
 * - Idle: constructed, not started
 * - Scheduled: a frame request is pending with the host
 * - Running: inside the host's frame callback
 * - Stopped: torn down, nothing is ever scheduled again
 *
 * The loop keeps re-arming while drawing is suppressed (paused, or
 * off-screen), so it resumes on the very next callback once eligible.
 */

#include <shaderstack/frame_host.h>
#include <shaderstack/param.h>

#include <cstdint>
#include <functional>
#include <memory>

namespace shaderstack {

enum class SchedulerState {
    Idle,
    Scheduled,
    Running,
    Stopped
};

inline const char* schedulerStateName(SchedulerState state) {
    switch (state) {
        case SchedulerState::Idle:      return "Idle";
        case SchedulerState::Scheduled: return "Scheduled";
        case SchedulerState::Running:   return "Running";
        case SchedulerState::Stopped:   return "Stopped";
        default:                        return "Unknown";
    }
}

/**
 * @brief Flags and clock that decide whether a frame draws
 *
 * paused and visible are cells: written whenever the caller or an observer
 * has news, read once per frame.
 */
struct ScheduleState {
    Param<bool> paused{"paused", false};
    Param<bool> visible{"visible", true};
    bool animateWhenOffscreen = false;
    double startTime = 0.0;  ///< Host clock (ms) at start()

    /// @brief !paused && (visible || animateWhenOffscreen)
    bool eligible() const {
        return !paused.get() && (visible.get() || animateWhenOffscreen);
    }
};

class FrameScheduler {
public:
    /// Draws one frame; receives seconds since start()
    using RenderFn = std::function<void(float timeSeconds)>;

    FrameScheduler(FrameHost& host, RenderFn render);
    ~FrameScheduler();

    // Non-copyable
    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    /// @brief Idle -> Scheduled. Records the start time. No-op otherwise.
    void start();

    /**
     * @brief Make sure a frame request is pending while the loop is live
     *
     * Used when drawing becomes eligible again; re-enters the normal
     * scheduled path if no request is outstanding.
     */
    void ensureScheduled();

    /**
     * @brief Any state -> Stopped; cancels the pending request
     * @return True if a frame request was pending when stopped
     */
    bool stop();

    SchedulerState state() const { return m_state; }
    bool hasPendingFrame() const { return m_pending != 0; }

    ScheduleState& schedule() { return m_schedule; }
    const ScheduleState& schedule() const { return m_schedule; }

    void setPaused(bool paused) { m_schedule.paused = paused; }
    void setVisible(bool visible) { m_schedule.visible = visible; }
    void setAnimateWhenOffscreen(bool enabled) { m_schedule.animateWhenOffscreen = enabled; }

    /// @brief Seconds between start() and @p nowMs, never negative
    float elapsedSeconds(double nowMs) const;

    /// @brief Time value passed to the last rendered frame
    float lastTime() const { return m_lastTime; }

    uint64_t framesRendered() const { return m_rendered; }
    uint64_t framesSkipped() const { return m_skipped; }

private:
    void arm();
    void onFrame(double nowMs);

    FrameHost& m_host;
    RenderFn m_render;
    ScheduleState m_schedule;
    SchedulerState m_state = SchedulerState::Idle;
    FrameRequestId m_pending = 0;
    float m_lastTime = 0.0f;
    uint64_t m_rendered = 0;
    uint64_t m_skipped = 0;

    // Expires with the scheduler; requests that outlive it do nothing
    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
};

} // namespace shaderstack
