/*
Calcula — GridTheme
Role: Colors, fonts and chrome metrics used by every layer.
Inputs/Outputs: Plain struct; defaults match the light spreadsheet look. GridSettings can override it.
Threading: Copied into the render session; not shared.
Performance: N/A.
Integration: Read by the layers through IFrameAccessor::getTheme().
Observability: None.
Related: GridSettings.h, StyleResolver.hpp.
Assumptions: All colors are valid QColor values; string validation happens in GridSettings.
*/
#pragma once
#include <QColor>
#include <QString>
#include <array>

struct GridTheme {
    QColor cellBackground{0xff, 0xff, 0xff};
    QColor gridLine{0xe2, 0xe2, 0xe2};
    QColor cellText{0x00, 0x00, 0x00};
    QColor cellTextError{0xcc, 0x00, 0x00};
    QString cellFontFamily = QStringLiteral("system-ui");
    double cellFontSize = 13.0;

    QColor headerBackground{0xf8, 0xf9, 0xfa};
    QColor headerText{0x66, 0x66, 0x66};
    QColor headerBorder{0xd0, 0xd0, 0xd0};
    QColor headerHighlight{0xcc, 0xe0, 0xf5};
    QColor headerHighlightText{0x1a, 0x5f, 0xb4};
    QColor headerPartialHighlight{0xe3, 0xec, 0xf7};
    QColor headerFilteredText{0x00, 0x66, 0xcc};   // row numbers while rows are hidden
    double headerFontSize = 12.0;
    QColor cornerBackground{0xf0, 0xf0, 0xf0};

    QColor selectionBackground{33, 115, 215, 38};  // rgba(33,115,215,0.15)
    QColor selectionBorder{0x21, 0x73, 0xd7};
    QColor activeCellBorder{0x1a, 0x5f, 0xb4};
    QColor fillHandleBorder{0x16, 0xa3, 0x4a};

    QColor fillPreviewBackground{22, 163, 74, 26};  // rgba(22,163,74,0.1)
    QColor fillPreviewBorder{0x16, 0xa3, 0x4a};
    QColor dragPreviewBackground{33, 115, 215, 38};
    QColor dragPreviewBorder{0x25, 0x63, 0xeb};

    QColor clipboardCut{0x16, 0xa3, 0x4a};
    QColor clipboardCopy{0x25, 0x63, 0xeb};

    QColor freezeSeparator{0x66, 0x66, 0x66};
    double freezeSeparatorWidth = 2.0;

    // Rotating palette for formula reference boxes
    std::array<QColor, 8> referenceColors{{
        QColor(0x00, 0x66, 0xCC), QColor(0xCC, 0x00, 0x66), QColor(0x00, 0xCC, 0x66), QColor(0xCC, 0x66, 0x00),
        QColor(0x66, 0x00, 0xCC), QColor(0x00, 0xCC, 0xCC), QColor(0xCC, 0x00, 0x00), QColor(0x66, 0xCC, 0x00)
    }};
};
