#include <gtest/gtest.h>
#include "core/sheet/CellReference.h"

TEST(CellReferenceTest, ColumnLetters) {
    EXPECT_EQ(columnToLetter(0), QStringLiteral("A"));
    EXPECT_EQ(columnToLetter(25), QStringLiteral("Z"));
    EXPECT_EQ(columnToLetter(26), QStringLiteral("AA"));
    EXPECT_EQ(columnToLetter(701), QStringLiteral("ZZ"));
    EXPECT_EQ(columnToLetter(702), QStringLiteral("AAA"));
    EXPECT_TRUE(columnToLetter(-1).isEmpty());
}

TEST(CellReferenceTest, LettersToColumn) {
    EXPECT_EQ(letterToColumn(QStringLiteral("A")), std::optional<int>(0));
    EXPECT_EQ(letterToColumn(QStringLiteral("aa")), std::optional<int>(26));
    EXPECT_EQ(letterToColumn(QStringLiteral("AAA")), std::optional<int>(702));
    EXPECT_FALSE(letterToColumn(QString()).has_value());
    EXPECT_FALSE(letterToColumn(QStringLiteral("A1")).has_value());
    EXPECT_FALSE(letterToColumn(QStringLiteral("ZZZZZZZZ")).has_value());

    for (int col : {0, 1, 25, 26, 51, 52, 701, 702, 16383}) {
        EXPECT_EQ(letterToColumn(columnToLetter(col)), std::optional<int>(col)) << col;
    }
}

TEST(CellReferenceTest, SheetNameQuoting) {
    EXPECT_EQ(formatSheetName(QStringLiteral("Sheet1")), QStringLiteral("Sheet1"));
    EXPECT_EQ(formatSheetName(QStringLiteral("Sheet 2")), QStringLiteral("'Sheet 2'"));
    EXPECT_EQ(formatSheetName(QStringLiteral("2024")), QStringLiteral("'2024'"));
    EXPECT_EQ(formatSheetName(QStringLiteral("Bob's")), QStringLiteral("'Bob''s'"));
    EXPECT_EQ(formatSheetName(QStringLiteral("Q[1]")), QStringLiteral("'Q[1]'"));
    EXPECT_EQ(formatSheetName(QStringLiteral("Wow!")), QStringLiteral("'Wow!'"));
}

TEST(CellReferenceTest, CellReferences) {
    EXPECT_EQ(cellToReference(2, 1), QStringLiteral("B3"));
    EXPECT_EQ(cellToReference(2, 1, QStringLiteral("Sheet1"), QStringLiteral("Sheet1")), QStringLiteral("B3"));
    EXPECT_EQ(cellToReference(2, 1, QStringLiteral("Sheet 2"), QStringLiteral("Sheet1")),
              QStringLiteral("'Sheet 2'!B3"));
    EXPECT_EQ(cellToReference(0, 0, QStringLiteral("Data"), QStringLiteral("Sheet1")), QStringLiteral("Data!A1"));
}

TEST(CellReferenceTest, SheetPrefixIsCaseSensitive) {
    EXPECT_EQ(sheetPrefix(QStringLiteral("data"), QStringLiteral("Data")), QStringLiteral("data!"));
    EXPECT_TRUE(sheetPrefix(QString(), QStringLiteral("Data")).isEmpty());
}

TEST(CellReferenceTest, RangeReferences) {
    EXPECT_EQ(rangeToReference(0, 0, 0, 0), QStringLiteral("A1"));
    EXPECT_EQ(rangeToReference(4, 3, 0, 0), QStringLiteral("A1:D5"));
    EXPECT_EQ(rangeToReference(0, 0, 1, 1, QStringLiteral("Sheet 2"), QStringLiteral("Sheet1")),
              QStringLiteral("'Sheet 2'!A1:B2"));
    EXPECT_EQ(columnRangeToReference(3, 3), QStringLiteral("D:D"));
    EXPECT_EQ(columnRangeToReference(5, 2), QStringLiteral("C:F"));
    EXPECT_EQ(rowRangeToReference(4, 6), QStringLiteral("5:7"));
    EXPECT_EQ(rowRangeToReference(6, 4, QStringLiteral("Data"), QString()), QStringLiteral("Data!5:7"));
}
