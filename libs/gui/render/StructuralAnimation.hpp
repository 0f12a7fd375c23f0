/*
Calcula — StructuralAnimation
Role: Turns an in-flight row/column insert or delete into per-axis coordinate shifts.
Inputs/Outputs: InsertionAnimation in; AxisShift offsets out. InsertionAnimationClock advances progress.
Threading: GUI thread only; the clock is driven by GridFrameDriver's QTimer.
Performance: O(1) per lookup.
Integration: Shifts are applied by FreezeGeometry, the grid line/cell layers and the header layer.
Observability: Clock start/finish is logged on calcula.render.
Related: GridFrameDriver.h, FreezeGeometry.hpp.
Assumptions: Only one structural animation is active at a time.
*/
#pragma once
#include <optional>
#include "../../core/sheet/model/SheetData.h"

double easeOutCubic(double t);

// Signed pixel offset of an animation: negative while inserting, positive while deleting
double structuralOffset(const InsertionAnimation& animation);

// Offset applied to every index >= fromIndex on one axis
struct AxisShift {
    int fromIndex = -1;
    double offset = 0.0;

    bool isActive() const { return fromIndex >= 0 && offset != 0.0; }
    double at(int index) const { return (fromIndex >= 0 && index >= fromIndex) ? offset : 0.0; }
};

struct AnimationShifts {
    AxisShift rows;
    AxisShift cols;

    static AnimationShifts fromAnimation(const std::optional<InsertionAnimation>& animation);
};

class InsertionAnimationClock {
public:
    void start(const InsertionAnimation& animation, double durationMs);
    void cancel();

    // Returns true while the animation is still running after this step
    bool advance(double elapsedMs);

    bool isActive() const { return m_animation.has_value(); }
    const std::optional<InsertionAnimation>& current() const { return m_animation; }
    double getDurationMs() const { return m_durationMs; }

private:
    std::optional<InsertionAnimation> m_animation;
    double m_durationMs = 0.0;
    double m_elapsedMs = 0.0;
};
