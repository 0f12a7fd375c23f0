#include "StructuralAnimation.hpp"
#include "../../core/CalculaLogging.hpp"
#include <algorithm>

double easeOutCubic(double t) {
    const double clamped = std::clamp(t, 0.0, 1.0);
    const double inv = 1.0 - clamped;
    return 1.0 - inv * inv * inv;
}

double structuralOffset(const InsertionAnimation& animation) {
    const double magnitude = (1.0 - easeOutCubic(animation.progress)) * animation.targetSize * animation.count;
    return animation.direction == StructuralChange::Insert ? -magnitude : magnitude;
}

AnimationShifts AnimationShifts::fromAnimation(const std::optional<InsertionAnimation>& animation) {
    AnimationShifts shifts;
    if (!animation || animation->count <= 0) return shifts;

    AxisShift shift;
    shift.fromIndex = std::max(0, animation->index);
    shift.offset = structuralOffset(*animation);
    if (animation->type == AnimationAxis::Row) {
        shifts.rows = shift;
    } else {
        shifts.cols = shift;
    }
    return shifts;
}

void InsertionAnimationClock::start(const InsertionAnimation& animation, double durationMs) {
    m_animation = animation;
    m_animation->progress = 0.0;
    m_durationMs = durationMs;
    m_elapsedMs = 0.0;
    cgLog_Render("Structural animation started: index=" << animation.index
                 << " count=" << animation.count << " duration=" << durationMs << "ms");
    if (m_durationMs <= 0.0) {
        // Zero-length animations finish on the first tick
        m_animation->progress = 1.0;
    }
}

void InsertionAnimationClock::cancel() {
    m_animation.reset();
    m_elapsedMs = 0.0;
}

bool InsertionAnimationClock::advance(double elapsedMs) {
    if (!m_animation) return false;

    if (elapsedMs > 0.0) m_elapsedMs += elapsedMs;
    const double target = m_durationMs > 0.0 ? m_elapsedMs / m_durationMs : 1.0;
    m_animation->progress = std::clamp(std::max(m_animation->progress, target), 0.0, 1.0);

    if (m_animation->progress >= 1.0) {
        cgLog_Render("Structural animation finished after " << m_elapsedMs << "ms");
        m_animation.reset();
        return false;
    }
    return true;
}
