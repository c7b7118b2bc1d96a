/*
 * layoutanalyzer.cpp — Reconstruct visual rows and columns from block boxes
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "layoutanalyzer.h"

#include <QDebug>
#include <QPair>
#include <QtMath>

#include <algorithm>

namespace Layout {

namespace {

bool byTop(const Block &a, const Block &b)
{
    return a.box.y1 < b.box.y1;
}

bool isFigure(const Block &block)
{
    return block.isImage || Ocr::isImageType(block.type);
}

} // anonymous namespace

LayoutAnalyzer::LayoutAnalyzer(const AnalyzerSettings &settings)
    : m_settings(settings)
{
}

// --- Caption binding ---

bool LayoutAnalyzer::isAdjacentCaption(const Block &image, const Block &candidate) const
{
    if (!Ocr::isCaptionType(candidate.type))
        return false;

    const qreal gap = candidate.box.y1 - image.box.y2;
    if (gap < -m_settings.captionMaxGapAbove || gap > m_settings.captionMaxGapBelow)
        return false;

    const qreal cx = candidate.box.centerX();
    return cx >= image.box.x1 - m_settings.captionHorizontalSlack
        && cx <= image.box.x2 + m_settings.captionHorizontalSlack;
}

QList<Block> LayoutAnalyzer::bindImageCaptions(const QList<Block> &blocks) const
{
    QList<Block> sorted = blocks;
    std::stable_sort(sorted.begin(), sorted.end(), byTop);

    QList<bool> consumed(sorted.size(), false);
    QList<Block> result;

    for (int i = 0; i < sorted.size(); ++i) {
        if (consumed[i])
            continue;

        Block block = sorted[i];
        if (isFigure(block)) {
            for (int j = i + 1; j < sorted.size(); ++j) {
                if (consumed[j] || !isAdjacentCaption(block, sorted[j]))
                    continue;
                const Block &caption = sorted[j];
                block.content += QStringLiteral("<br/>") + caption.content;
                block.box.y2 = qMax(block.box.y2, caption.box.y2);
                consumed[j] = true;
                break;
            }
        }
        result.append(block);
    }
    return result;
}

// --- Row formation ---

// Headings and unpositioned text always get a row of their own.
bool LayoutAnalyzer::standsAlone(const Block &block)
{
    return !block.positioned || Ocr::isHeadingType(block.type);
}

QList<int> LayoutAnalyzer::collectOverlapping(int seed, const QList<Block> &sorted,
                                              QList<bool> &assigned) const
{
    qreal rowTop = sorted[seed].box.y1;
    qreal rowBottom = sorted[seed].box.y2;
    QList<int> members{seed};
    assigned[seed] = true;

    // Grow until no unassigned block overlaps the band any more.
    for (;;) {
        int found = -1;
        for (int i = 0; i < sorted.size(); ++i) {
            if (assigned[i] || standsAlone(sorted[i]))
                continue;
            const Block &b = sorted[i];
            if (b.box.y1 < rowBottom && b.box.y2 > rowTop) {
                found = i;
                break;
            }
        }
        if (found < 0)
            break;

        members.append(found);
        assigned[found] = true;
        rowTop = qMin(rowTop, sorted[found].box.y1);
        rowBottom = qMax(rowBottom, sorted[found].box.y2);
    }
    return members;
}

// --- Column clustering ---

QList<Column> LayoutAnalyzer::clusterIntoColumns(const QList<Block> &blocks) const
{
    QList<Block> sorted = blocks;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Block &a, const Block &b) {
        return a.box.centerX() < b.box.centerX();
    });

    QList<Column> columns;
    for (const Block &block : sorted) {
        const qreal left = block.box.x1;
        const qreal right = block.box.x2;

        int best = -1;
        qreal bestOverlap = 0;
        for (int c = 0; c < columns.size(); ++c) {
            const Column &col = columns[c];
            const qreal overlap = qMax<qreal>(0, qMin(col.right, right) - qMax(col.left, left));
            const qreal minWidth = qMin(col.width(), block.box.width());
            if (overlap > minWidth * m_settings.columnOverlapRatio && overlap > bestOverlap) {
                best = c;
                bestOverlap = overlap;
            }
        }

        if (best >= 0) {
            Column &col = columns[best];
            col.blocks.append(block);
            col.left = qMin(col.left, left);
            col.right = qMax(col.right, right);
            col.centerX = (col.left + col.right) / 2;
        } else {
            Column col;
            col.blocks.append(block);
            col.left = left;
            col.right = right;
            col.centerX = block.box.centerX();
            columns.append(col);
        }
    }

    for (Column &col : columns)
        std::stable_sort(col.blocks.begin(), col.blocks.end(), byTop);
    std::stable_sort(columns.begin(), columns.end(), [](const Column &a, const Column &b) {
        return a.left < b.left;
    });
    return columns;
}

// --- Entry point ---

QList<VisualRow> LayoutAnalyzer::analyze(const QList<Block> &blocks) const
{
    const QList<Block> bound = bindImageCaptions(blocks);

    QList<Block> valid;
    for (const Block &b : bound) {
        if (b.content.isEmpty() && !b.isImage)
            continue;
        if (!b.box.hasArea()) {
            qDebug() << "LayoutAnalyzer: dropping zero-area block of type" << b.type;
            continue;
        }
        valid.append(b);
    }

    QList<VisualRow> rows;
    if (valid.isEmpty())
        return rows;

    std::stable_sort(valid.begin(), valid.end(), byTop);
    QList<bool> assigned(valid.size(), false);

    for (int i = 0; i < valid.size(); ++i) {
        if (assigned[i])
            continue;

        if (standsAlone(valid[i])) {
            assigned[i] = true;
            const Block &b = valid[i];
            Column col;
            col.blocks.append(b);
            col.left = b.box.x1;
            col.right = b.box.x2;
            col.centerX = b.box.centerX();
            VisualRow row;
            row.columns.append(col);
            row.top = b.box.y1;
            row.bottom = b.box.y2;
            rows.append(row);
            continue;
        }

        const QList<int> members = collectOverlapping(i, valid, assigned);
        QList<Block> rowBlocks;
        VisualRow row;
        row.top = valid[i].box.y1;
        row.bottom = valid[i].box.y2;
        for (int m : members) {
            rowBlocks.append(valid[m]);
            row.top = qMin(row.top, valid[m].box.y1);
            row.bottom = qMax(row.bottom, valid[m].box.y2);
        }
        row.columns = clusterIntoColumns(rowBlocks);
        if (!row.columns.isEmpty())
            rows.append(row);
    }

    std::stable_sort(rows.begin(), rows.end(), [](const VisualRow &a, const VisualRow &b) {
        return a.top < b.top;
    });
    return rows;
}

QList<int> LayoutAnalyzer::columnWidthPercents(const VisualRow &row)
{
    QList<qreal> widths;
    qreal total = 0;
    for (const Column &col : row.columns) {
        const qreal w = qMax<qreal>(1, col.width());
        widths.append(w);
        total += w;
    }

    // Largest remainder, so the row always sums to exactly 100.
    QList<int> percents;
    QList<QPair<qreal, int>> remainders;
    int assigned = 0;
    for (int i = 0; i < widths.size(); ++i) {
        const qreal exact = widths[i] / total * 100;
        const int floored = qFloor(exact);
        percents.append(floored);
        remainders.append({exact - floored, i});
        assigned += floored;
    }
    std::stable_sort(remainders.begin(), remainders.end(),
                     [](const QPair<qreal, int> &a, const QPair<qreal, int> &b) {
                         return a.first > b.first;
                     });
    for (int k = 0; assigned < 100 && k < remainders.size(); ++k, ++assigned)
        ++percents[remainders[k].second];
    return percents;
}

} // namespace Layout
