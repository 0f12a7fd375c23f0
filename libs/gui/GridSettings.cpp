#include "GridSettings.h"
#include "GridFrameDriver.h"
#include "GridRenderSession.h"
#include "render/StyleResolver.hpp"
#include "../core/CalculaLogging.hpp"
#include <QSettings>
#include <limits>

namespace {
    struct ColorKey {
        const char* key;
        QColor GridTheme::*member;
    };

    // Every persisted theme color, keyed under grid/theme/
    const ColorKey kThemeColors[] = {
        {"cellBackground", &GridTheme::cellBackground},
        {"gridLine", &GridTheme::gridLine},
        {"cellText", &GridTheme::cellText},
        {"cellTextError", &GridTheme::cellTextError},
        {"headerBackground", &GridTheme::headerBackground},
        {"headerText", &GridTheme::headerText},
        {"headerBorder", &GridTheme::headerBorder},
        {"headerHighlight", &GridTheme::headerHighlight},
        {"headerHighlightText", &GridTheme::headerHighlightText},
        {"headerPartialHighlight", &GridTheme::headerPartialHighlight},
        {"headerFilteredText", &GridTheme::headerFilteredText},
        {"cornerBackground", &GridTheme::cornerBackground},
        {"selectionBackground", &GridTheme::selectionBackground},
        {"selectionBorder", &GridTheme::selectionBorder},
        {"activeCellBorder", &GridTheme::activeCellBorder},
        {"fillHandleBorder", &GridTheme::fillHandleBorder},
        {"fillPreviewBackground", &GridTheme::fillPreviewBackground},
        {"fillPreviewBorder", &GridTheme::fillPreviewBorder},
        {"dragPreviewBackground", &GridTheme::dragPreviewBackground},
        {"dragPreviewBorder", &GridTheme::dragPreviewBorder},
        {"clipboardCut", &GridTheme::clipboardCut},
        {"clipboardCopy", &GridTheme::clipboardCopy},
        {"freezeSeparator", &GridTheme::freezeSeparator},
    };

    constexpr double kMaxFontSize = 200.0;
    constexpr double kMaxHandleSize = 64.0;
    constexpr double kMaxFrameIntervalMs = 1000.0;
}

GridSettings::GridSettings(QSettings& settings)
    : m_settings(settings) {
}

QString GridSettings::fullKey(const QString& key) {
    return QString::fromLatin1(kGroup) + QLatin1Char('/') + key;
}

QString GridSettings::toCssHex(const QColor& color) {
    const QString rgb = color.name(QColor::HexRgb);
    if (color.alpha() == 255) return rgb;
    return rgb + QStringLiteral("%1").arg(color.alpha(), 2, 16, QLatin1Char('0'));
}

QColor GridSettings::readColor(const QString& key, const QColor& fallback) const {
    const QString path = fullKey(key);
    if (!m_settings.contains(path)) return fallback;

    const QString stored = m_settings.value(path).toString();
    if (isValidColor(stored)) {
        if (std::optional<QColor> parsed = parseCssColor(stored)) return *parsed;
    }
    cgLog_ConfigWarn("GridSettings: invalid color" << stored << "for" << path << "- using" << toCssHex(fallback));
    return fallback;
}

double GridSettings::readNumber(const QString& key, double fallback, double min, double max) const {
    const QString path = fullKey(key);
    if (!m_settings.contains(path)) return fallback;

    bool ok = false;
    const double value = m_settings.value(path).toDouble(&ok);
    if (ok && value >= min && value <= max) return value;
    cgLog_ConfigWarn("GridSettings: value" << m_settings.value(path).toString() << "for" << path
                     << "outside [" << min << "," << max << "] - using" << fallback);
    return fallback;
}

QString GridSettings::readString(const QString& key, const QString& fallback) const {
    const QString value = m_settings.value(fullKey(key), fallback).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

GridTheme GridSettings::loadTheme(const GridTheme& defaults) const {
    GridTheme theme = defaults;
    for (const ColorKey& entry : kThemeColors) {
        const QString key = QStringLiteral("theme/") + QLatin1String(entry.key);
        theme.*entry.member = readColor(key, defaults.*entry.member);
    }
    theme.cellFontFamily = readString(QStringLiteral("theme/cellFontFamily"), defaults.cellFontFamily);
    theme.cellFontSize = readNumber(QStringLiteral("theme/cellFontSize"), defaults.cellFontSize, 1.0, kMaxFontSize);
    theme.headerFontSize = readNumber(QStringLiteral("theme/headerFontSize"), defaults.headerFontSize, 1.0, kMaxFontSize);
    theme.freezeSeparatorWidth =
        readNumber(QStringLiteral("theme/freezeSeparatorWidth"), defaults.freezeSeparatorWidth, 0.5, 16.0);
    cgLog_Config("GridSettings: theme loaded");
    return theme;
}

void GridSettings::saveTheme(const GridTheme& theme) {
    for (const ColorKey& entry : kThemeColors) {
        const QString key = QStringLiteral("theme/") + QLatin1String(entry.key);
        m_settings.setValue(fullKey(key), toCssHex(theme.*entry.member));
    }
    m_settings.setValue(fullKey(QStringLiteral("theme/cellFontFamily")), theme.cellFontFamily);
    m_settings.setValue(fullKey(QStringLiteral("theme/cellFontSize")), theme.cellFontSize);
    m_settings.setValue(fullKey(QStringLiteral("theme/headerFontSize")), theme.headerFontSize);
    m_settings.setValue(fullKey(QStringLiteral("theme/freezeSeparatorWidth")), theme.freezeSeparatorWidth);
}

HitTestTuning GridSettings::loadTuning(const HitTestTuning& defaults) const {
    HitTestTuning tuning = defaults;
    tuning.columnDragThreshold =
        readNumber(QStringLiteral("tuning/columnDragThreshold"), defaults.columnDragThreshold, 0.0, 1.0);
    tuning.rowDragThreshold = readNumber(QStringLiteral("tuning/rowDragThreshold"), defaults.rowDragThreshold, 0.0, 1.0);
    tuning.resizeHandleSize =
        readNumber(QStringLiteral("tuning/resizeHandleSize"), defaults.resizeHandleSize, 1.0, kMaxHandleSize);
    tuning.referenceCornerTolerance = readNumber(QStringLiteral("tuning/referenceCornerTolerance"),
                                                 defaults.referenceCornerTolerance, 0.0, kMaxHandleSize);
    tuning.referenceEdgeTolerance = readNumber(QStringLiteral("tuning/referenceEdgeTolerance"),
                                               defaults.referenceEdgeTolerance, 0.0, kMaxHandleSize);
    tuning.selectionEdgeTolerance = readNumber(QStringLiteral("tuning/selectionEdgeTolerance"),
                                               defaults.selectionEdgeTolerance, 0.0, kMaxHandleSize);
    tuning.fillHandleSize =
        readNumber(QStringLiteral("tuning/fillHandleSize"), defaults.fillHandleSize, 1.0, kMaxHandleSize);
    return tuning;
}

void GridSettings::saveTuning(const HitTestTuning& tuning) {
    m_settings.setValue(fullKey(QStringLiteral("tuning/columnDragThreshold")), tuning.columnDragThreshold);
    m_settings.setValue(fullKey(QStringLiteral("tuning/rowDragThreshold")), tuning.rowDragThreshold);
    m_settings.setValue(fullKey(QStringLiteral("tuning/resizeHandleSize")), tuning.resizeHandleSize);
    m_settings.setValue(fullKey(QStringLiteral("tuning/referenceCornerTolerance")), tuning.referenceCornerTolerance);
    m_settings.setValue(fullKey(QStringLiteral("tuning/referenceEdgeTolerance")), tuning.referenceEdgeTolerance);
    m_settings.setValue(fullKey(QStringLiteral("tuning/selectionEdgeTolerance")), tuning.selectionEdgeTolerance);
    m_settings.setValue(fullKey(QStringLiteral("tuning/fillHandleSize")), tuning.fillHandleSize);
}

double GridSettings::loadAntsStep(double fallback) const {
    return readNumber(QStringLiteral("animation/antsStep"), fallback, std::numeric_limits<double>::min(), 8.0);
}

void GridSettings::saveAntsStep(double step) {
    m_settings.setValue(fullKey(QStringLiteral("animation/antsStep")), step);
}

std::chrono::milliseconds GridSettings::loadFrameInterval(std::chrono::milliseconds fallback) const {
    const double ms = readNumber(QStringLiteral("animation/frameIntervalMs"), static_cast<double>(fallback.count()),
                                 1.0, kMaxFrameIntervalMs);
    return std::chrono::milliseconds(static_cast<long long>(ms));
}

void GridSettings::saveFrameInterval(std::chrono::milliseconds interval) {
    m_settings.setValue(fullKey(QStringLiteral("animation/frameIntervalMs")), static_cast<qlonglong>(interval.count()));
}

void GridSettings::apply(GridRenderSession& session, GridFrameDriver& driver) const {
    session.setTheme(loadTheme(session.getTheme()));
    session.setTuning(loadTuning(session.getTuning()));
    driver.setAntsStep(loadAntsStep(driver.getAntsStep()));
    driver.setFrameInterval(loadFrameInterval(driver.getFrameInterval()));
    cgLog_App("Grid settings applied from" << m_settings.fileName());
}
