#include "TextLayout.hpp"
#include "StyleResolver.hpp"
#include <QRegularExpression>

QString TextLayout::ellipsis() {
    return QStringLiteral("...");
}

FittedText TextLayout::fitToWidth(IDrawSurface& surface, const QString& text, double maxWidth) {
    const double fullWidth = surface.measureText(text);
    if (fullWidth <= maxWidth) return FittedText{text, fullWidth, false};

    const QString dots = ellipsis();
    const double dotsWidth = surface.measureText(dots);
    if (dotsWidth >= maxWidth) {
        // No room for any character; the clip hides whatever overflows
        return FittedText{dots, dotsWidth, true};
    }

    int lo = 0;
    int hi = text.size();
    while (lo < hi) {
        const int mid = (lo + hi + 1) / 2;
        if (surface.measureText(text.left(mid)) + dotsWidth <= maxWidth) {
            lo = mid;
        } else {
            hi = mid - 1;
        }
    }
    // Never keep half of a surrogate pair
    if (lo > 0 && lo < text.size() && text.at(lo).isLowSurrogate()) --lo;
    const QString fitted = text.left(lo) + dots;
    return FittedText{fitted, surface.measureText(fitted), true};
}

QStringList TextLayout::wrapLines(IDrawSurface& surface, const QString& text, double maxWidth) {
    if (maxWidth <= 0.0) return QStringList{text};

    static const QRegularExpression whitespaceRun(QStringLiteral("(\\s+)"));
    auto trimEnd = [](const QString& s) {
        int end = s.size();
        while (end > 0 && s.at(end - 1).isSpace()) --end;
        return s.left(end);
    };

    QStringList lines;
    const QStringList paragraphs = text.split(QLatin1Char('\n'));
    for (const QString& paragraph : paragraphs) {
        // Split into alternating word / whitespace tokens
        QStringList tokens;
        int pos = 0;
        auto it = whitespaceRun.globalMatch(paragraph);
        while (it.hasNext()) {
            const auto match = it.next();
            if (match.capturedStart() > pos) tokens << paragraph.mid(pos, match.capturedStart() - pos);
            tokens << match.captured(1);
            pos = match.capturedEnd();
        }
        if (pos < paragraph.size()) tokens << paragraph.mid(pos);

        QString current;
        for (const QString& token : tokens) {
            const QString candidate = current + token;
            if (surface.measureText(candidate) <= maxWidth) {
                current = candidate;
                continue;
            }
            const bool isSpace = token.trimmed().isEmpty();
            if (!trimEnd(current).isEmpty()) lines << trimEnd(current);
            current.clear();
            if (isSpace) continue;  // break replaces the whitespace

            if (surface.measureText(token) <= maxWidth) {
                current = token;
                continue;
            }
            for (int i = 0; i < token.size();) {
                const int units = (token.at(i).isHighSurrogate() && i + 1 < token.size()
                                   && token.at(i + 1).isLowSurrogate()) ? 2 : 1;
                const QString glyph = token.mid(i, units);
                if (!current.isEmpty() && surface.measureText(current + glyph) > maxWidth) {
                    lines << current;
                    current.clear();
                }
                current += glyph;
                i += units;
            }
        }
        const QString tail = trimEnd(current);
        if (!tail.isEmpty() || paragraph.isEmpty()) lines << tail;
    }
    if (lines.isEmpty()) lines << QString();
    return lines;
}

double TextLayout::alignedX(HorizontalAlign align, double left, double right, double textWidth, double padding) {
    switch (align) {
    case HorizontalAlign::Right:
        return right - padding - textWidth;
    case HorizontalAlign::Center:
        return left + (right - left - textWidth) / 2.0;
    case HorizontalAlign::General:
    case HorizontalAlign::Left:
        break;
    }
    return left + padding;
}

QString FontCache::describe(const QString& family, double pixelSize, bool bold, bool italic) {
    QString key;
    if (italic) key += QStringLiteral("italic ");
    if (bold) key += QStringLiteral("bold ");
    key += QString::number(pixelSize) + QStringLiteral("px ") + family;
    return key;
}

const QFont& FontCache::fontFor(const QString& family, double pixelSize, bool bold, bool italic) {
    const QString key = describe(family, pixelSize, bold, italic);
    auto it = m_fonts.find(key);
    if (it == m_fonts.end()) {
        it = m_fonts.insert(key, makeCellFont(family, pixelSize, bold, italic));
    }
    return it.value();
}
