#include "GridFrameDriver.h"
#include "../core/CalculaLogging.hpp"
#include "render/strategies/ClipboardLayer.hpp"
#include <cmath>

ClipboardAntsPhase::ClipboardAntsPhase(double step, double period)
    : m_step(step > 0.0 ? step : kDefaultStep)
    , m_period(period > 0.0 ? period : kDefaultPeriod) {
}

bool ClipboardAntsPhase::advance() {
    m_offset += m_step;
    if (m_offset < m_period) return false;
    m_offset = std::fmod(m_offset, m_period);
    ++m_wraps;
    return true;
}

void ClipboardAntsPhase::reset() {
    m_offset = 0.0;
    m_wraps = 0;
}

void ClipboardAntsPhase::setStep(double step) {
    if (step > 0.0) m_step = step;
}

GridFrameDriver::GridFrameDriver(QObject* parent)
    : QObject(parent)
    , m_ants(ClipboardAntsPhase::kDefaultStep, ClipboardLayer::kDashPeriod) {
    m_timer = new QTimer(this);
    m_timer->setTimerType(Qt::PreciseTimer);
    m_timer->setInterval(m_interval);
    connect(m_timer, &QTimer::timeout, this, &GridFrameDriver::tick);
}

GridFrameDriver::~GridFrameDriver() {
    m_timer->stop();
}

void GridFrameDriver::setFrameInterval(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        cgLog_Warn("GridFrameDriver: ignoring non-positive frame interval" << interval.count() << "ms");
        return;
    }
    m_interval = interval;
    m_timer->setInterval(m_interval);
}

void GridFrameDriver::setClipboardMode(ClipboardMode mode) {
    if (mode == m_clipboardMode) return;
    m_clipboardMode = mode;
    m_ants.reset();
    cgLog_Render("GridFrameDriver: clipboard mode" << static_cast<int>(mode));
    updateTimer();
    emit frameRequested();
}

void GridFrameDriver::startStructuralAnimation(const InsertionAnimation& animation, double durationMs) {
    m_clock.start(animation, durationMs);
    updateTimer();
    emit frameRequested();
}

void GridFrameDriver::cancelStructuralAnimation() {
    if (!m_clock.isActive()) return;
    m_clock.cancel();
    updateTimer();
    emit frameRequested();
}

void GridFrameDriver::applyTo(GridFrame& frame) const {
    frame.clipboard.dashOffset = m_clipboardMode == ClipboardMode::None ? 0.0 : m_ants.getOffset();
    frame.insertionAnimation = m_clock.current();
}

bool GridFrameDriver::isAnimating() const {
    return m_clipboardMode != ClipboardMode::None || m_clock.isActive();
}

void GridFrameDriver::tick() {
    const double elapsedMs = m_frameClock.isValid()
        ? static_cast<double>(m_frameClock.restart())
        : static_cast<double>(m_interval.count());
    if (!m_frameClock.isValid()) m_frameClock.start();
    advance(elapsedMs);
}

void GridFrameDriver::advance(double elapsedMs) {
    if (!isAnimating()) return;

    if (m_clipboardMode != ClipboardMode::None && m_ants.advance()) {
        cgLog_RenderN(30, "marching ants wrapped" << m_ants.getWrapCount() << "times");
    }

    bool finished = false;
    if (m_clock.isActive()) {
        finished = !m_clock.advance(elapsedMs);
    }

    emit frameRequested();
    if (finished) {
        emit animationFinished();
        updateTimer();
    }
}

void GridFrameDriver::updateTimer() {
    if (isAnimating()) {
        if (!m_timer->isActive()) {
            m_frameClock.invalidate();
            m_timer->start();
            cgLog_Render("GridFrameDriver: timer started," << m_interval.count() << "ms interval");
        }
    } else if (m_timer->isActive()) {
        m_timer->stop();
        cgLog_Render("GridFrameDriver: timer stopped");
    }
}
