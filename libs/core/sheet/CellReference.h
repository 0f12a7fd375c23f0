/*
Calcula — CellReference
Role: A1-style naming: column letters, sheet-qualified cell/range/row/column references.
Inputs/Outputs: 0-based indices in; strings like "B3", "'My Sheet'!A1:C4", "D:D", "5:7" out (and letters back to indices).
Threading: Pure functions.
Performance: O(number of letters).
Integration: HeaderLayer labels columns with columnToLetter; the interaction layer inserts references while editing formulas.
Observability: None.
Related: HeaderLayer.hpp, SheetData.h.
Assumptions: Indices are >= 0; a sheet prefix is emitted only when the target differs from the current sheet.
*/
#pragma once
#include <QString>
#include <optional>

QString columnToLetter(int col);
// "A" -> 0, "AA" -> 26; case-insensitive; nothing for empty or non-letter input
std::optional<int> letterToColumn(const QString& letters);

// Quotes names with whitespace, quotes, '!' or brackets, or a leading digit
QString formatSheetName(const QString& sheetName);
QString sheetPrefix(const QString& targetSheet, const QString& currentSheet);

QString cellToReference(int row, int col, const QString& targetSheet = QString(),
                        const QString& currentSheet = QString());
QString rangeToReference(int startRow, int startCol, int endRow, int endCol,
                         const QString& targetSheet = QString(), const QString& currentSheet = QString());
QString columnRangeToReference(int startCol, int endCol, const QString& targetSheet = QString(),
                               const QString& currentSheet = QString());
QString rowRangeToReference(int startRow, int endRow, const QString& targetSheet = QString(),
                            const QString& currentSheet = QString());
