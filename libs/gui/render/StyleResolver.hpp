/*
Calcula — StyleResolver
Role: Turns a cell's stored style record (plus interceptor overrides) into concrete paint attributes.
Inputs/Outputs: CellData + StyleDataMap + GridTheme in; ResolvedCellStyle (QColor/QFont-ready values) out.
Threading: Pure functions; the regexes are function-local statics (thread-safe init).
Performance: One map lookup and a handful of string checks per painted cell.
Integration: Used by CellContentLayer and GridRenderSession's autofit.
Observability: Interceptor failures are logged on calcula.render by StyleHookRegistry.
Related: RenderHooks.hpp, CellContentLayer.hpp, GridTheme.hpp.
Assumptions: Color strings come from the backend unvalidated; anything unrecognised falls back to the theme.
*/
#pragma once
#include <QColor>
#include <QFont>
#include <QString>
#include <optional>
#include "GridTheme.hpp"
#include "../../core/sheet/model/SheetData.h"

class StyleHookRegistry;

// ===== VALUE / COLOR CLASSIFIERS =====

bool isValidColor(const QString& color);
std::optional<QColor> parseCssColor(const QString& color);
bool isDefaultTextColor(const QString& color);
bool isDefaultBackgroundColor(const QString& color);

bool isNumericValue(const QString& text);
bool isErrorValue(const QString& text);

// ===== STYLE RECORDS =====

const StyleData& defaultStyle();

// styles[index], else styles[0], else the built-in default
const StyleData& lookupStyle(const StyleDataMap* styles, int styleIndex);

// Fields a style interceptor may change; alignment and borders are not overridable
struct StyleOverride {
    std::optional<QString> textColor;
    std::optional<QString> backgroundColor;
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<bool> underline;
    std::optional<bool> strikethrough;
    std::optional<double> fontSize;
    std::optional<QString> fontFamily;

    void mergeFrom(const StyleOverride& later);
    StyleData appliedTo(const StyleData& base) const;
};

struct ResolvedBorder {
    BorderLineStyle style = BorderLineStyle::None;
    QColor color;
    double width = 0.0;

    bool isVisible() const { return style != BorderLineStyle::None && width > 0.0; }
};

struct ResolvedCellStyle {
    QString fontFamily;
    double fontSize = 13.0;
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool strikethrough = false;
    QColor textColor;
    std::optional<QColor> background;
    HorizontalAlign align = HorizontalAlign::Left;   // never General once resolved
    VerticalAlign verticalAlign = VerticalAlign::Middle;
    bool wrapText = false;
    double rotation = 0.0;                            // degrees, counter-clockwise positive
    ResolvedBorder borderTop;
    ResolvedBorder borderRight;
    ResolvedBorder borderBottom;
    ResolvedBorder borderLeft;

    bool hasVisibleBorder() const {
        return borderTop.isVisible() || borderRight.isVisible() || borderBottom.isVisible() || borderLeft.isVisible();
    }
};

ResolvedCellStyle resolveCellStyle(const CellData& cell, const StyleDataMap* styles, const GridTheme& theme,
                                   const StyleHookRegistry* hooks);

// Whether an empty cell still paints something (background or border)
bool hasVisibleDecoration(const StyleData& style);

QFont makeCellFont(const QString& family, double pixelSize, bool bold, bool italic);
