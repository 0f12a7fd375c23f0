#include "StyleResolver.hpp"
#include "RenderHooks.hpp"
#include <QRegularExpression>
#include <QStringList>
#include <unordered_map>
#include <algorithm>
#include <cmath>

namespace {

static constexpr double kMaxSaneFontSize = 200.0;

bool isSaneFontSize(double size) {
    return size > 0.0 && size < kMaxSaneFontSize;
}

// CSS values for the accepted color names
const std::unordered_map<QString, QRgb>& namedColors() {
    static const std::unordered_map<QString, QRgb> names = {
        {QStringLiteral("black"), qRgb(0x00, 0x00, 0x00)},   {QStringLiteral("white"), qRgb(0xff, 0xff, 0xff)},
        {QStringLiteral("red"), qRgb(0xff, 0x00, 0x00)},     {QStringLiteral("green"), qRgb(0x00, 0x80, 0x00)},
        {QStringLiteral("blue"), qRgb(0x00, 0x00, 0xff)},    {QStringLiteral("yellow"), qRgb(0xff, 0xff, 0x00)},
        {QStringLiteral("cyan"), qRgb(0x00, 0xff, 0xff)},    {QStringLiteral("magenta"), qRgb(0xff, 0x00, 0xff)},
        {QStringLiteral("gray"), qRgb(0x80, 0x80, 0x80)},    {QStringLiteral("grey"), qRgb(0x80, 0x80, 0x80)},
        {QStringLiteral("orange"), qRgb(0xff, 0xa5, 0x00)},  {QStringLiteral("pink"), qRgb(0xff, 0xc0, 0xcb)},
        {QStringLiteral("purple"), qRgb(0x80, 0x00, 0x80)},  {QStringLiteral("brown"), qRgb(0xa5, 0x2a, 0x2a)},
        {QStringLiteral("transparent"), qRgba(0, 0, 0, 0)}
    };
    return names;
}

const QRegularExpression& hashHexPattern() {
    static const QRegularExpression re(QStringLiteral("^#([0-9a-f]{3}|[0-9a-f]{4}|[0-9a-f]{6}|[0-9a-f]{8})$"),
                                       QRegularExpression::CaseInsensitiveOption);
    return re;
}

// Backends occasionally send 6/8 digit hex without the '#'
const QRegularExpression& bareHexPattern() {
    static const QRegularExpression re(QStringLiteral("^([0-9a-f]{6}|[0-9a-f]{8})$"),
                                       QRegularExpression::CaseInsensitiveOption);
    return re;
}

const QRegularExpression& rgbPattern() {
    static const QRegularExpression re(
        QStringLiteral("^rgba?\\s*\\(\\s*(\\d+)\\s*,\\s*(\\d+)\\s*,\\s*(\\d+)\\s*(?:,\\s*([\\d.]+)\\s*)?\\)$"),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

// Expands #RGB / #RGBA shorthand and reads CSS order (alpha last)
std::optional<QColor> parseHexDigits(QString digits) {
    if (digits.size() == 3 || digits.size() == 4) {
        QString expanded;
        for (QChar c : digits) {
            expanded.append(c);
            expanded.append(c);
        }
        digits = expanded;
    }
    bool ok = false;
    const uint value = digits.toUInt(&ok, 16);
    if (!ok) return std::nullopt;
    if (digits.size() == 6) {
        return QColor((value >> 16) & 0xff, (value >> 8) & 0xff, value & 0xff);
    }
    if (digits.size() == 8) {
        return QColor((value >> 24) & 0xff, (value >> 16) & 0xff, (value >> 8) & 0xff, value & 0xff);
    }
    return std::nullopt;
}

ResolvedBorder resolveBorder(const BorderSide& side) {
    ResolvedBorder border;
    if (!side.isVisible()) return border;
    border.style = side.style;
    border.width = side.width;
    border.color = parseCssColor(side.color).value_or(QColor(Qt::black));
    return border;
}

} // namespace

bool isValidColor(const QString& color) {
    const QString trimmed = color.trimmed();
    if (trimmed.isEmpty()) return false;
    if (hashHexPattern().match(trimmed).hasMatch()) return true;
    if (bareHexPattern().match(trimmed).hasMatch()) return true;
    if (rgbPattern().match(trimmed).hasMatch()) return true;
    return namedColors().count(trimmed.toLower()) > 0;
}

std::optional<QColor> parseCssColor(const QString& color) {
    const QString trimmed = color.trimmed();
    if (trimmed.isEmpty()) return std::nullopt;

    if (hashHexPattern().match(trimmed).hasMatch()) return parseHexDigits(trimmed.mid(1));
    if (bareHexPattern().match(trimmed).hasMatch()) return parseHexDigits(trimmed);

    const QRegularExpressionMatch rgb = rgbPattern().match(trimmed);
    if (rgb.hasMatch()) {
        const int r = std::clamp(rgb.captured(1).toInt(), 0, 255);
        const int g = std::clamp(rgb.captured(2).toInt(), 0, 255);
        const int b = std::clamp(rgb.captured(3).toInt(), 0, 255);
        double alpha = 1.0;
        if (!rgb.captured(4).isEmpty()) {
            bool ok = false;
            alpha = rgb.captured(4).toDouble(&ok);
            if (!ok) return std::nullopt;
        }
        QColor parsed(r, g, b);
        parsed.setAlphaF(static_cast<float>(std::clamp(alpha, 0.0, 1.0)));
        return parsed;
    }

    const auto it = namedColors().find(trimmed.toLower());
    if (it == namedColors().end()) return std::nullopt;
    return QColor::fromRgba(it->second);
}

bool isDefaultTextColor(const QString& color) {
    if (color.trimmed().isEmpty()) return true;
    const auto parsed = parseCssColor(color);
    return parsed && parsed->rgba() == QColor(Qt::black).rgba();
}

bool isDefaultBackgroundColor(const QString& color) {
    if (color.trimmed().isEmpty()) return true;
    const auto parsed = parseCssColor(color);
    if (!parsed) return false;
    return parsed->alpha() == 0 || parsed->rgba() == QColor(Qt::white).rgba();
}

bool isNumericValue(const QString& text) {
    static const QRegularExpression re(QStringLiteral("^-?[\\d,]+\\.?\\d*%?$|^-?\\.\\d+%?$"));
    const QString trimmed = text.trimmed();
    return !trimmed.isEmpty() && re.match(trimmed).hasMatch();
}

bool isErrorValue(const QString& text) {
    static const QRegularExpression re(
        QStringLiteral("^#(NULL!|DIV/0!|VALUE!|REF!|NAME\\?|NUM!|N/A|SPILL!|CALC!|CIRC!|ERROR!?)$"),
        QRegularExpression::CaseInsensitiveOption);
    return re.match(text.trimmed()).hasMatch();
}

const StyleData& defaultStyle() {
    static const StyleData style;
    return style;
}

const StyleData& lookupStyle(const StyleDataMap* styles, int styleIndex) {
    if (styles) {
        auto it = styles->find(styleIndex);
        if (it != styles->end()) return it->second;
        it = styles->find(0);
        if (it != styles->end()) return it->second;
    }
    return defaultStyle();
}

void StyleOverride::mergeFrom(const StyleOverride& later) {
    if (later.textColor) textColor = later.textColor;
    if (later.backgroundColor) backgroundColor = later.backgroundColor;
    if (later.bold) bold = later.bold;
    if (later.italic) italic = later.italic;
    if (later.underline) underline = later.underline;
    if (later.strikethrough) strikethrough = later.strikethrough;
    if (later.fontSize) fontSize = later.fontSize;
    if (later.fontFamily) fontFamily = later.fontFamily;
}

StyleData StyleOverride::appliedTo(const StyleData& base) const {
    StyleData effective = base;
    if (textColor) effective.textColor = *textColor;
    if (backgroundColor) effective.backgroundColor = *backgroundColor;
    if (bold) effective.bold = *bold;
    if (italic) effective.italic = *italic;
    if (underline) effective.underline = *underline;
    if (strikethrough) effective.strikethrough = *strikethrough;
    if (fontSize) effective.fontSize = *fontSize;
    if (fontFamily) effective.fontFamily = *fontFamily;
    return effective;
}

QFont makeCellFont(const QString& family, double pixelSize, bool bold, bool italic) {
    QFont font;
    if (!family.isEmpty() && family != QLatin1String("system-ui")) {
        font.setFamilies(QStringList{family});
    }
    font.setPixelSize(std::max(1, static_cast<int>(std::lround(pixelSize))));
    font.setBold(bold);
    font.setItalic(italic);
    return font;
}

bool hasVisibleDecoration(const StyleData& style) {
    const bool hasBackground = isValidColor(style.backgroundColor) && !isDefaultBackgroundColor(style.backgroundColor);
    return hasBackground || style.borderTop.isVisible() || style.borderRight.isVisible()
        || style.borderBottom.isVisible() || style.borderLeft.isVisible();
}

ResolvedCellStyle resolveCellStyle(const CellData& cell, const StyleDataMap* styles, const GridTheme& theme,
                                   const StyleHookRegistry* hooks) {
    const StyleData& base = lookupStyle(styles, cell.styleIndex);
    StyleData effective = base;
    if (hooks && hooks->hasInterceptors()) {
        effective = hooks->interceptStyle(cell.display, base, CellCoord{cell.row, cell.col}).appliedTo(base);
    }

    ResolvedCellStyle resolved;
    resolved.fontSize = isSaneFontSize(effective.fontSize) ? effective.fontSize : theme.cellFontSize;
    resolved.fontFamily = effective.fontFamily.trimmed().isEmpty() ? theme.cellFontFamily : effective.fontFamily;
    resolved.bold = effective.bold;
    resolved.italic = effective.italic;
    resolved.underline = effective.underline;
    resolved.strikethrough = effective.strikethrough;
    resolved.wrapText = effective.wrapText;
    resolved.rotation = effective.textRotation;
    resolved.verticalAlign = effective.verticalAlign;

    resolved.textColor = theme.cellText;
    if (isValidColor(effective.textColor) && !isDefaultTextColor(effective.textColor)) {
        resolved.textColor = parseCssColor(effective.textColor).value_or(theme.cellText);
    }
    if (isValidColor(effective.backgroundColor) && !isDefaultBackgroundColor(effective.backgroundColor)) {
        resolved.background = parseCssColor(effective.backgroundColor);
    }

    switch (effective.textAlign) {
    case HorizontalAlign::General:
        if (isErrorValue(cell.display)) {
            resolved.align = HorizontalAlign::Center;
            resolved.textColor = theme.cellTextError;
        } else if (isNumericValue(cell.display)) {
            resolved.align = HorizontalAlign::Right;
        } else {
            resolved.align = HorizontalAlign::Left;
        }
        break;
    default:
        resolved.align = effective.textAlign;
        break;
    }

    // Borders come from the stored record only
    resolved.borderTop = resolveBorder(base.borderTop);
    resolved.borderRight = resolveBorder(base.borderRight);
    resolved.borderBottom = resolveBorder(base.borderBottom);
    resolved.borderLeft = resolveBorder(base.borderLeft);
    return resolved;
}
