/*
 * tagparsertest.cpp — Tagged OCR stream scanning and box resolution
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "boxresolver.h"
#include "tagparser.h"

using namespace Ocr;

class TagParserTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testSingleBlock();
    void testGapText();
    void testMalformedCoordinates();
    void testNoMarkers();
    void testMissingRawText();
    void testTypeNormalization();
    void testMathDelimiters();
    void testClaimMatchingBox();
    void testClaimRescaled();
    void testClaimWithoutDims();
    void testNormalizeBox();
    void testResolveGapBox();
    void testResolveFallbackWidth();
};

void TagParserTest::testSingleBlock()
{
    TagParser parser;
    const QList<ParsedBlock> blocks = parser.parse(
        QStringLiteral("<|ref|>text<|/ref|><|det|>[[10, 20, 300, 40]]<|/det|>Hello world\n"));

    QVERIFY(parser.foundMarkers());
    QCOMPARE(parser.error(), TagParser::NoError);
    QCOMPARE(blocks.size(), 1);
    QCOMPARE(blocks[0].type, QStringLiteral("text"));
    QCOMPARE(blocks[0].content, QStringLiteral("Hello world"));
    QVERIFY(blocks[0].positioned);
    QCOMPARE(blocks[0].box, (Box{10, 20, 300, 40}));
}

void TagParserTest::testGapText()
{
    TagParser parser;
    const QList<ParsedBlock> blocks = parser.parse(
        QStringLiteral("Preamble\n<|ref|>title<|/ref|><|det|>[[0,0,100,10]]<|/det|># Title"));

    QCOMPARE(blocks.size(), 2);
    QCOMPARE(blocks[0].type, QStringLiteral("text"));
    QCOMPARE(blocks[0].content, QStringLiteral("Preamble"));
    QVERIFY(!blocks[0].positioned);
    QCOMPARE(blocks[1].type, QStringLiteral("title"));
    QCOMPARE(blocks[1].content, QStringLiteral("# Title"));
}

void TagParserTest::testMalformedCoordinates()
{
    TagParser parser;
    const QList<ParsedBlock> blocks = parser.parse(
        QStringLiteral("<|ref|>text<|/ref|><|det|>[[1,2,3]]<|/det|>dropped"
                       "<|ref|>text<|/ref|><|det|>[[0,0,a,1]]<|/det|>also dropped"
                       "<|ref|>text<|/ref|><|det|>[[0,0,5,5]]<|/det|>kept"));

    QVERIFY(parser.foundMarkers());
    QCOMPARE(blocks.size(), 1);
    QCOMPARE(blocks[0].content, QStringLiteral("kept"));
}

void TagParserTest::testNoMarkers()
{
    TagParser parser;
    const QList<ParsedBlock> blocks = parser.parse(QStringLiteral("just some text"));
    QVERIFY(!parser.foundMarkers());
    QVERIFY(blocks.isEmpty());
    QCOMPARE(parser.error(), TagParser::NoError);
}

void TagParserTest::testMissingRawText()
{
    TagParser parser;
    QVERIFY(parser.parse(QString()).isEmpty());
    QCOMPARE(parser.error(), TagParser::MissingRawText);

    QVERIFY(parser.parse(QStringLiteral("")).isEmpty());
    QCOMPARE(parser.error(), TagParser::NoError);
}

void TagParserTest::testTypeNormalization()
{
    TagParser parser;
    const QList<ParsedBlock> blocks = parser.parse(
        QStringLiteral("<|ref|> Image_Caption <|/ref|><|det|>[[0,0,5,5]]<|/det|>  Fig. 1  "));
    QCOMPARE(blocks.size(), 1);
    QCOMPARE(blocks[0].type, QStringLiteral("image_caption"));
    QCOMPARE(blocks[0].content, QStringLiteral("Fig. 1"));
}

void TagParserTest::testMathDelimiters()
{
    QCOMPARE(TagParser::normalizeMathDelimiters(QStringLiteral("a \\(x\\) b \\[y\\]")),
             QStringLiteral("a $x$ b $$y$$"));
}

void TagParserTest::testClaimMatchingBox()
{
    const QList<OcrBox> boxes{
        {QStringLiteral("text"), Box{0, 0, 400, 100}},
        {QStringLiteral("text"), Box{0, 0, 400, 100}},
    };
    BoxResolver resolver(boxes, ImageDims{1000, 1000});

    // 50px tolerance on a 1000px page
    QCOMPARE(resolver.claimMatchingBox(Box{40, 40, 440, 140}), 0);
    QCOMPARE(resolver.claimMatchingBox(Box{0, 0, 400, 100}), 1);
    QCOMPARE(resolver.claimMatchingBox(Box{0, 0, 400, 100}), -1);
    QCOMPARE(resolver.claimedIndices().size(), 2);

    BoxResolver strict(boxes, ImageDims{1000, 1000});
    QCOMPARE(strict.claimMatchingBox(Box{60, 0, 400, 100}), -1);
}

void TagParserTest::testClaimRescaled()
{
    const QList<OcrBox> boxes{{QStringLiteral("image"), Box{200, 400, 1000, 1200}}};
    BoxResolver resolver(boxes, ImageDims{2000, 4000});

    QCOMPARE(resolver.claimMatchingBox(Box{100, 100, 500, 300}), 0);
}

void TagParserTest::testClaimWithoutDims()
{
    const QList<OcrBox> boxes{{QStringLiteral("text"), Box{100, 100, 400, 200}}};

    // Unknown page size: fixed 20px per axis
    BoxResolver loose(boxes, ImageDims{});
    QCOMPARE(loose.claimMatchingBox(Box{115, 85, 420, 180}), 0);

    BoxResolver strict(boxes, ImageDims{});
    QCOMPARE(strict.claimMatchingBox(Box{125, 100, 400, 200}), -1);
}

void TagParserTest::testResolveFallbackWidth()
{
    TagParser parser;
    QList<ParsedBlock> blocks = parser.parse(
        QStringLiteral("lead\n<|ref|>text<|/ref|><|det|>[[0,0,400,100]]<|/det|>First"));
    QCOMPARE(blocks.size(), 2);

    BoxResolver resolver({}, ImageDims{});
    resolver.resolve(blocks, 640);
    QCOMPARE(blocks[0].box, (Box{0, 0, 640, 1}));
}

void TagParserTest::testNormalizeBox()
{
    QCOMPARE(BoxResolver::normalizeBox(Box{100, 100, 500, 500}, ImageDims{2000, 1000}),
             (Box{200, 100, 1000, 500}));
    QCOMPARE(BoxResolver::normalizeBox(Box{100, 100, 500, 500}, ImageDims{800, 600}),
             (Box{100, 100, 500, 500}));
    QCOMPARE(BoxResolver::normalizeBox(Box{100, 100, 1500, 500}, ImageDims{2000, 1000}),
             (Box{100, 100, 1500, 500}));
    QCOMPARE(BoxResolver::normalizeBox(Box{1, 2, 3, 4}, ImageDims{}), (Box{1, 2, 3, 4}));
}

void TagParserTest::testResolveGapBox()
{
    TagParser parser;
    QList<ParsedBlock> blocks = parser.parse(
        QStringLiteral("<|ref|>text<|/ref|><|det|>[[0,0,400,100]]<|/det|>First\nbetween"));
    QCOMPARE(blocks.size(), 1);
    QCOMPARE(blocks[0].content, QStringLiteral("First\nbetween"));

    blocks = parser.parse(
        QStringLiteral("<|ref|>text<|/ref|><|det|>[[0,0,400,100]]<|/det|>First"
                       "<|ref|>bogus<|/ref|>between"
                       "<|ref|>text<|/ref|><|det|>[[0,200,400,300]]<|/det|>Second"));
    QCOMPARE(blocks.size(), 3);
    QCOMPARE(blocks[0].content, QStringLiteral("First"));
    QVERIFY(!blocks[1].positioned);
    QVERIFY(blocks[1].content.endsWith(QLatin1String("between")));

    blocks = parser.parse(
        QStringLiteral("<|ref|>text<|/ref|><|det|>[[0,0,400,100]]<|/det|>First"
                       "<|ref|>text<|/ref|><|det|>[[x]]<|/det|>"
                       "<|ref|>text<|/ref|><|det|>[[0,200,400,300]]<|/det|>Second"));
    QCOMPARE(blocks.size(), 2);

    QList<ParsedBlock> withGap = parser.parse(
        QStringLiteral("lead\n<|ref|>text<|/ref|><|det|>[[0,0,400,100]]<|/det|>First"));
    QCOMPARE(withGap.size(), 2);

    BoxResolver resolver({}, ImageDims{800, 1200});
    resolver.resolve(withGap);
    QCOMPARE(withGap[0].box, (Box{0, 0, 800, 1}));
    QCOMPARE(withGap[0].boxIndex, -1);
    QCOMPARE(withGap[1].boxIndex, -1);
    QCOMPARE(withGap[1].box, (Box{0, 0, 400, 100}));
}

QTEST_GUILESS_MAIN(TagParserTest)
#include "tagparsertest.moc"
