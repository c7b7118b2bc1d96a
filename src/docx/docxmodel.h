/*
 * docxmodel.h — Paragraph/table/run object graph of a generated DOCX
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_DOCXMODEL_H
#define SCAN2DOC_DOCXMODEL_H

#include "mathnode.h"

#include <QByteArray>
#include <QList>
#include <QString>

#include <variant>

namespace Docx {

struct TextRun {
    QString text;
    bool bold = false;
    bool italic = false;
};

// Sizes are logical pixels (96 dpi), as the image is shown, not stored.
struct ImageRun {
    QString imageId;
    QByteArray pngData;
    int width = 0;
    int height = 0;
};

struct MathRun {
    Latex::MathNode math;
    QString latex;
    bool display = false;
};

struct BreakRun {
};

using Run = std::variant<TextRun, ImageRun, MathRun, BreakRun>;

// Twips; -1 leaves the value to the style.
struct Spacing {
    int before = -1;
    int after = -1;
    int line = -1;
};

struct Paragraph {
    QList<Run> runs;
    int headingLevel = 0; // 1-4, 0 for body text
    Spacing spacing;
    int firstLineIndent = 0;
};

struct TableCell {
    QList<Paragraph> paragraphs;
    int widthPercent = 0; // 0 means auto
};

struct TableRow {
    QList<TableCell> cells;
};

struct Table {
    QList<TableRow> rows;
    bool borderless = false;
};

using Block = std::variant<Paragraph, Table>;

struct Document {
    QList<Block> blocks;
    bool cjk = false; // selects the CJK default font and character spacing
};

} // namespace Docx

#endif // SCAN2DOC_DOCXMODEL_H
