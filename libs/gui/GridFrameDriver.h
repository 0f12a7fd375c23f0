/*
Calcula — GridFrameDriver
Role: Timer-driven animation clock for the grid: clipboard marching ants and structural insert/delete slides.
Inputs/Outputs: Clipboard mode and animation requests in; dash phase + animation progress out, plus frameRequested().
Threading: Lives on the GUI thread (QTimer); tests drive advance() directly without an event loop.
Performance: The timer only runs while something animates.
Integration: Owned by the grid widget next to GridRenderSession; applyTo() stamps its state into the next GridFrame.
Observability: Start/stop transitions on calcula.render; ants wraps sampled via cgLog_RenderN.
Related: GridRenderSession.h, ClipboardLayer.hpp, StructuralAnimation.hpp, GridSettings.h.
Assumptions: One frame per tick; the ants advance a fixed step per frame regardless of timer jitter.
*/
#pragma once
#include <QObject>
#include <QElapsedTimer>
#include <QTimer>
#include <chrono>
#include <optional>
#include "render/GridTypes.hpp"
#include "render/StructuralAnimation.hpp"

// Dash phase of the clipboard border; wraps at the dash period
class ClipboardAntsPhase {
public:
    static constexpr double kDefaultStep = 0.5;

    static constexpr double kDefaultPeriod = 8.0;

    explicit ClipboardAntsPhase(double step = kDefaultStep, double period = kDefaultPeriod);

    // Returns true when this step wrapped past the period
    bool advance();
    void reset();

    double getOffset() const { return m_offset; }
    double getStep() const { return m_step; }
    double getPeriod() const { return m_period; }
    int getWrapCount() const { return m_wraps; }
    void setStep(double step);

private:
    double m_step;
    double m_period;
    double m_offset = 0.0;
    int m_wraps = 0;
};

class GridFrameDriver : public QObject {
    Q_OBJECT

public:
    static constexpr std::chrono::milliseconds kDefaultFrameInterval{16};
    static constexpr double kDefaultAnimationDurationMs = 150.0;

    explicit GridFrameDriver(QObject* parent = nullptr);
    ~GridFrameDriver() override;

    // Configuration
    void setFrameInterval(std::chrono::milliseconds interval);
    std::chrono::milliseconds getFrameInterval() const { return m_interval; }
    void setAntsStep(double step) { m_ants.setStep(step); }
    double getAntsStep() const { return m_ants.getStep(); }

    // Animation sources
    void setClipboardMode(ClipboardMode mode);
    ClipboardMode getClipboardMode() const { return m_clipboardMode; }
    void startStructuralAnimation(const InsertionAnimation& animation,
                                  double durationMs = kDefaultAnimationDurationMs);
    void cancelStructuralAnimation();

    // State for the next frame
    double getDashOffset() const { return m_ants.getOffset(); }
    const ClipboardAntsPhase& getAnts() const { return m_ants; }
    const std::optional<InsertionAnimation>& getStructuralAnimation() const { return m_clock.current(); }
    void applyTo(GridFrame& frame) const;

    bool isAnimating() const;
    bool isTimerActive() const { return m_timer->isActive(); }

public slots:
    // One frame: elapsed time is measured since the previous tick
    void tick();
    // One frame with an explicit elapsed time
    void advance(double elapsedMs);

signals:
    void frameRequested();
    void animationFinished();

private:
    void updateTimer();

    QTimer* m_timer = nullptr;
    QElapsedTimer m_frameClock;
    std::chrono::milliseconds m_interval = kDefaultFrameInterval;

    ClipboardMode m_clipboardMode = ClipboardMode::None;
    ClipboardAntsPhase m_ants;
    InsertionAnimationClock m_clock;
};
