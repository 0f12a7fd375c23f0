#include "CellReference.h"
#include <QRegularExpression>
#include <algorithm>
#include <limits>

QString columnToLetter(int col) {
    QString result;
    for (int c = col; c >= 0; c = c / 26 - 1) {
        result.prepend(QChar('A' + c % 26));
    }
    return result;
}

std::optional<int> letterToColumn(const QString& letters) {
    if (letters.isEmpty()) return std::nullopt;
    long long value = 0;
    for (const QChar ch : letters) {
        const char16_t upper = ch.toUpper().unicode();
        if (upper < u'A' || upper > u'Z') return std::nullopt;
        value = value * 26 + (upper - u'A' + 1);
        if (value > std::numeric_limits<int>::max()) return std::nullopt;
    }
    return static_cast<int>(value - 1);
}

QString formatSheetName(const QString& sheetName) {
    static const QRegularExpression needsQuoting(QStringLiteral("[\\s'!\\[\\]]|^\\d"));
    if (!needsQuoting.match(sheetName).hasMatch()) return sheetName;
    QString escaped = sheetName;
    escaped.replace(QLatin1Char('\''), QStringLiteral("''"));
    return QStringLiteral("'") + escaped + QStringLiteral("'");
}

QString sheetPrefix(const QString& targetSheet, const QString& currentSheet) {
    if (targetSheet.isEmpty() || targetSheet == currentSheet) return QString();
    return formatSheetName(targetSheet) + QStringLiteral("!");
}

QString cellToReference(int row, int col, const QString& targetSheet, const QString& currentSheet) {
    return sheetPrefix(targetSheet, currentSheet) + columnToLetter(col) + QString::number(row + 1);
}

QString rangeToReference(int startRow, int startCol, int endRow, int endCol, const QString& targetSheet,
                         const QString& currentSheet) {
    const int minRow = std::min(startRow, endRow);
    const int maxRow = std::max(startRow, endRow);
    const int minCol = std::min(startCol, endCol);
    const int maxCol = std::max(startCol, endCol);

    const QString first = columnToLetter(minCol) + QString::number(minRow + 1);
    if (minRow == maxRow && minCol == maxCol) return sheetPrefix(targetSheet, currentSheet) + first;
    return sheetPrefix(targetSheet, currentSheet) + first + QStringLiteral(":") + columnToLetter(maxCol)
        + QString::number(maxRow + 1);
}

QString columnRangeToReference(int startCol, int endCol, const QString& targetSheet, const QString& currentSheet) {
    return sheetPrefix(targetSheet, currentSheet) + columnToLetter(std::min(startCol, endCol)) + QStringLiteral(":")
        + columnToLetter(std::max(startCol, endCol));
}

QString rowRangeToReference(int startRow, int endRow, const QString& targetSheet, const QString& currentSheet) {
    return sheetPrefix(targetSheet, currentSheet) + QString::number(std::min(startRow, endRow) + 1)
        + QStringLiteral(":") + QString::number(std::max(startRow, endRow) + 1);
}
