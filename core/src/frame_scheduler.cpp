// ShaderStack - Frame Scheduler Implementation

#include <shaderstack/frame_scheduler.h>

#include <algorithm>
#include <utility>

namespace shaderstack {

FrameScheduler::FrameScheduler(FrameHost& host, RenderFn render)
    : m_host(host)
    , m_render(std::move(render))
{
}

FrameScheduler::~FrameScheduler() {
    stop();
}

void FrameScheduler::start() {
    if (m_state != SchedulerState::Idle) {
        return;
    }
    m_schedule.startTime = m_host.now();
    arm();
}

void FrameScheduler::ensureScheduled() {
    if (m_state == SchedulerState::Scheduled && m_pending == 0) {
        arm();
    }
}

bool FrameScheduler::stop() {
    bool hadPending = m_pending != 0;
    if (hadPending) {
        m_host.cancelFrame(m_pending);
        m_pending = 0;
    }
    m_state = SchedulerState::Stopped;
    return hadPending;
}

float FrameScheduler::elapsedSeconds(double nowMs) const {
    double seconds = (nowMs - m_schedule.startTime) / 1000.0;
    return static_cast<float>(std::max(0.0, seconds));
}

void FrameScheduler::arm() {
    m_state = SchedulerState::Scheduled;
    std::weak_ptr<bool> alive = m_alive;
    m_pending = m_host.requestFrame([this, alive](double nowMs) {
        if (alive.expired()) {
            return;
        }
        onFrame(nowMs);
    });
}

void FrameScheduler::onFrame(double nowMs) {
    // The request that fired is no longer pending
    m_pending = 0;
    if (m_state != SchedulerState::Scheduled) {
        return;
    }
    m_state = SchedulerState::Running;

    // Monotonic even if the host clock stutters backwards
    float t = std::max(elapsedSeconds(nowMs), m_lastTime);

    if (m_schedule.eligible()) {
        m_lastTime = t;
        if (m_render) {
            m_render(t);
        }
        ++m_rendered;
    } else {
        ++m_skipped;
    }

    // render may have stopped us (stack torn down from a layer callback)
    if (m_state == SchedulerState::Running) {
        arm();
    }
}

} // namespace shaderstack
