/*
 * layoutanalyzer.h — Reconstruct visual rows and columns from block boxes
 *
 * Blocks are grouped into horizontal bands (visual rows) by vertical
 * overlap, and each band is split into columns by horizontal overlap.
 * Figure captions are folded into their figure first.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SCAN2DOC_LAYOUTANALYZER_H
#define SCAN2DOC_LAYOUTANALYZER_H

#include "ocrtypes.h"

#include <QList>
#include <QString>

namespace Layout {

struct Block {
    QString type;
    QString content;
    Ocr::Box box;
    QString imageId;      // set when the block resolved to an extracted image
    bool isImage = false;
    bool positioned = true; // false for text found outside any marker
};

struct Column {
    QList<Block> blocks;  // top to bottom
    qreal left = 0;
    qreal right = 0;
    qreal centerX = 0;

    qreal width() const { return right - left; }
};

struct VisualRow {
    QList<Column> columns; // left to right
    qreal top = 0;
    qreal bottom = 0;
};

struct AnalyzerSettings {
    qreal columnOverlapRatio = 0.3;   // of the narrower of block and column
    qreal captionMaxGapAbove = 10;    // caption may start this far above the figure bottom
    qreal captionMaxGapBelow = 100;
    qreal captionHorizontalSlack = 50;
};

class LayoutAnalyzer {
public:
    explicit LayoutAnalyzer(const AnalyzerSettings &settings = {});

    QList<VisualRow> analyze(const QList<Block> &blocks) const;

    // Merges each figure with the first unconsumed caption just below it.
    // The result is sorted by top edge; consumed captions are dropped.
    QList<Block> bindImageCaptions(const QList<Block> &blocks) const;

    // Column spans as shares of the row, in whole percents summing to 100.
    static QList<int> columnWidthPercents(const VisualRow &row);

private:
    bool isAdjacentCaption(const Block &image, const Block &candidate) const;
    QList<int> collectOverlapping(int seed, const QList<Block> &sorted,
                                  QList<bool> &assigned) const;
    QList<Column> clusterIntoColumns(const QList<Block> &blocks) const;
    static bool standsAlone(const Block &block);

    AnalyzerSettings m_settings;
};

} // namespace Layout

#endif // SCAN2DOC_LAYOUTANALYZER_H
