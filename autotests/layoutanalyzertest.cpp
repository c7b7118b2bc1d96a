/*
 * layoutanalyzertest.cpp — Row and column reconstruction, caption binding
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "layoutanalyzer.h"

using namespace Layout;

namespace {

Block makeBlock(const QString &type, const QString &content, const Ocr::Box &box)
{
    Block b;
    b.type = type;
    b.content = content;
    b.box = box;
    b.isImage = Ocr::isImageType(type);
    return b;
}

} // anonymous namespace

class LayoutAnalyzerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testSideBySide();
    void testSameColumn();
    void testHeadingOwnRow();
    void testUnpositionedTextOwnRow();
    void testRowGrowsToFixedPoint();
    void testDropsEmptyAndZeroArea();
    void testCaptionBinding();
    void testCaptionTooFar();
    void testCaptionOffToTheSide();
    void testColumnWidthPercents();
    void testNarrowColumnPercents();
};

void LayoutAnalyzerTest::testSideBySide()
{
    LayoutAnalyzer analyzer;
    const QList<VisualRow> rows = analyzer.analyze({
        makeBlock(QStringLiteral("text"), QStringLiteral("C"), {0, 200, 900, 300}),
        makeBlock(QStringLiteral("text"), QStringLiteral("B"), {500, 0, 900, 100}),
        makeBlock(QStringLiteral("text"), QStringLiteral("A"), {0, 0, 400, 100}),
    });

    QCOMPARE(rows.size(), 2);
    QCOMPARE(rows[0].columns.size(), 2);
    QCOMPARE(rows[0].columns[0].blocks.first().content, QStringLiteral("A"));
    QCOMPARE(rows[0].columns[1].blocks.first().content, QStringLiteral("B"));
    QCOMPARE(rows[1].columns.size(), 1);
    QCOMPARE(rows[1].columns[0].blocks.first().content, QStringLiteral("C"));
}

void LayoutAnalyzerTest::testSameColumn()
{
    LayoutAnalyzer analyzer;
    const QList<VisualRow> rows = analyzer.analyze({
        makeBlock(QStringLiteral("text"), QStringLiteral("lower"), {100, 50, 500, 150}),
        makeBlock(QStringLiteral("text"), QStringLiteral("upper"), {0, 0, 400, 100}),
    });

    QCOMPARE(rows.size(), 1);
    QCOMPARE(rows[0].columns.size(), 1);
    QCOMPARE(rows[0].columns[0].blocks.size(), 2);
    QCOMPARE(rows[0].columns[0].blocks[0].content, QStringLiteral("upper"));
    QCOMPARE(rows[0].columns[0].left, 0.0);
    QCOMPARE(rows[0].columns[0].right, 500.0);
}

void LayoutAnalyzerTest::testUnpositionedTextOwnRow()
{
    Block intro = makeBlock(QStringLiteral("text"), QStringLiteral("Intro"), {0, 0, 1000, 1});
    intro.positioned = false;

    LayoutAnalyzer analyzer;
    const QList<VisualRow> rows = analyzer.analyze({
        intro,
        makeBlock(QStringLiteral("text"), QStringLiteral("Left"), {0, 0, 400, 100}),
        makeBlock(QStringLiteral("text"), QStringLiteral("Right"), {500, 0, 900, 100}),
    });

    QCOMPARE(rows.size(), 2);
    QCOMPARE(rows[0].columns.size(), 1);
    QCOMPARE(rows[0].columns[0].blocks.size(), 1);
    QCOMPARE(rows[0].columns[0].blocks[0].content, QStringLiteral("Intro"));
    QCOMPARE(rows[1].columns.size(), 2);
    QCOMPARE(rows[1].columns[0].blocks[0].content, QStringLiteral("Left"));
    QCOMPARE(rows[1].columns[1].blocks[0].content, QStringLiteral("Right"));
}

void LayoutAnalyzerTest::testRowGrowsToFixedPoint()
{
    // "lower" does not touch "top", only the band already widened by "tall".
    LayoutAnalyzer analyzer;
    const QList<VisualRow> rows = analyzer.analyze({
        makeBlock(QStringLiteral("text"), QStringLiteral("top"), {0, 0, 400, 100}),
        makeBlock(QStringLiteral("text"), QStringLiteral("tall"), {500, 90, 900, 300}),
        makeBlock(QStringLiteral("text"), QStringLiteral("lower"), {0, 250, 400, 400}),
        makeBlock(QStringLiteral("text"), QStringLiteral("next"), {0, 500, 900, 600}),
    });

    QCOMPARE(rows.size(), 2);
    QCOMPARE(rows[0].top, 0.0);
    QCOMPARE(rows[0].bottom, 400.0);
    QCOMPARE(rows[0].columns.size(), 2);
    QCOMPARE(rows[0].columns[0].blocks.size(), 2);
    QCOMPARE(rows[0].columns[0].blocks[0].content, QStringLiteral("top"));
    QCOMPARE(rows[0].columns[0].blocks[1].content, QStringLiteral("lower"));
    QCOMPARE(rows[0].columns[1].blocks[0].content, QStringLiteral("tall"));
    QCOMPARE(rows[1].columns[0].blocks[0].content, QStringLiteral("next"));
}

void LayoutAnalyzerTest::testHeadingOwnRow()
{
    LayoutAnalyzer analyzer;
    const QList<VisualRow> rows = analyzer.analyze({
        makeBlock(QStringLiteral("title"), QStringLiteral("# Title"), {0, 0, 1000, 50}),
        makeBlock(QStringLiteral("text"), QStringLiteral("body"), {0, 20, 400, 100}),
    });

    QCOMPARE(rows.size(), 2);
    QCOMPARE(rows[0].columns[0].blocks.first().type, QStringLiteral("title"));
    QCOMPARE(rows[1].columns[0].blocks.first().content, QStringLiteral("body"));
}

void LayoutAnalyzerTest::testDropsEmptyAndZeroArea()
{
    LayoutAnalyzer analyzer;
    const QList<VisualRow> rows = analyzer.analyze({
        makeBlock(QStringLiteral("text"), QString(), {0, 0, 100, 100}),
        makeBlock(QStringLiteral("text"), QStringLiteral("flat"), {0, 10, 100, 10}),
        makeBlock(QStringLiteral("image"), QString(), {0, 200, 100, 300}),
    });

    QCOMPARE(rows.size(), 1);
    QCOMPARE(rows[0].columns[0].blocks.first().type, QStringLiteral("image"));
}

void LayoutAnalyzerTest::testCaptionBinding()
{
    LayoutAnalyzer analyzer;
    const QList<Block> bound = analyzer.bindImageCaptions({
        makeBlock(QStringLiteral("image_caption"), QStringLiteral("Fig. 1"), {150, 420, 450, 450}),
        makeBlock(QStringLiteral("image"), QStringLiteral("img"), {100, 100, 500, 400}),
    });

    QCOMPARE(bound.size(), 1);
    QCOMPARE(bound[0].content, QStringLiteral("img<br/>Fig. 1"));
    QCOMPARE(bound[0].box.y2, 450.0);
}

void LayoutAnalyzerTest::testCaptionTooFar()
{
    LayoutAnalyzer analyzer;
    const QList<Block> bound = analyzer.bindImageCaptions({
        makeBlock(QStringLiteral("image"), QStringLiteral("img"), {100, 100, 500, 400}),
        makeBlock(QStringLiteral("image_caption"), QStringLiteral("Fig. 1"), {150, 600, 450, 630}),
    });
    QCOMPARE(bound.size(), 2);
    QCOMPARE(bound[0].content, QStringLiteral("img"));
}

void LayoutAnalyzerTest::testCaptionOffToTheSide()
{
    LayoutAnalyzer analyzer;
    const QList<Block> bound = analyzer.bindImageCaptions({
        makeBlock(QStringLiteral("image"), QStringLiteral("img"), {100, 100, 500, 400}),
        makeBlock(QStringLiteral("caption"), QStringLiteral("side"), {600, 410, 800, 440}),
    });
    QCOMPARE(bound.size(), 2);
}

void LayoutAnalyzerTest::testColumnWidthPercents()
{
    VisualRow row;
    Column left;
    left.left = 0;
    left.right = 400;
    Column right;
    right.left = 500;
    right.right = 900;
    row.columns = {left, right};

    QCOMPARE(LayoutAnalyzer::columnWidthPercents(row), (QList<int>{50, 50}));

    right.right = 700;
    row.columns = {left, right};
    QCOMPARE(LayoutAnalyzer::columnWidthPercents(row), (QList<int>{67, 33}));
}

void LayoutAnalyzerTest::testNarrowColumnPercents()
{
    VisualRow row;
    for (int i = 0; i < 3; ++i) {
        Column col;
        col.left = i * 10;
        col.right = i * 10 + 2;
        row.columns.append(col);
    }

    const QList<int> percents = LayoutAnalyzer::columnWidthPercents(row);
    QCOMPARE(percents, (QList<int>{34, 33, 33}));
}

QTEST_GUILESS_MAIN(LayoutAnalyzerTest)
#include "layoutanalyzertest.moc"
