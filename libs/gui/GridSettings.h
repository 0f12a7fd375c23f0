/*
Calcula — GridSettings
Role: Persists the grid's tunables (theme, hit-test tuning, animation pacing) in a QSettings group.
Inputs/Outputs: Reads/writes keys under "grid/"; loads return defaults for missing or invalid values.
Threading: Same rules as the borrowed QSettings object (one thread at a time).
Performance: Called at startup and when preferences change; not on the frame path.
Integration: The application loads once and pushes the values into GridRenderSession and GridFrameDriver via apply().
Observability: Invalid stored values are reported with cgLog_ConfigWarn and replaced by defaults.
Related: GridTheme.hpp, HitTester.hpp (HitTestTuning), GridFrameDriver.h.
Assumptions: Colors are stored as CSS hex ("#rrggbb", or "#rrggbbaa" when translucent).
*/
#pragma once
#include <QColor>
#include <QString>
#include <chrono>
#include "render/GridTheme.hpp"
#include "render/HitTester.hpp"

class QSettings;
class GridRenderSession;
class GridFrameDriver;

class GridSettings {
public:
    static constexpr const char* kGroup = "grid";

    explicit GridSettings(QSettings& settings);

    GridTheme loadTheme(const GridTheme& defaults = GridTheme{}) const;
    void saveTheme(const GridTheme& theme);

    HitTestTuning loadTuning(const HitTestTuning& defaults = HitTestTuning{}) const;
    void saveTuning(const HitTestTuning& tuning);

    double loadAntsStep(double fallback) const;
    void saveAntsStep(double step);

    std::chrono::milliseconds loadFrameInterval(std::chrono::milliseconds fallback) const;
    void saveFrameInterval(std::chrono::milliseconds interval);

    // Loads everything and hands it to the session and driver
    void apply(GridRenderSession& session, GridFrameDriver& driver) const;

    static QString toCssHex(const QColor& color);

private:
    QColor readColor(const QString& key, const QColor& fallback) const;
    double readNumber(const QString& key, double fallback, double min, double max) const;
    QString readString(const QString& key, const QString& fallback) const;

    static QString fullKey(const QString& key);

    QSettings& m_settings;
};
