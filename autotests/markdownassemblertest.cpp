/*
 * markdownassemblertest.cpp — Page Markdown assembly
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "markdownassembler.h"

class MarkdownAssemblerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testTwoColumnRow();
    void testLeadingTextKeepsColumns();
    void testGapTextVerbatim();
    void testSingleBlocks();
    void testNoMarkers();
    void testMissingRawText();
    void testOrphanImages();
    void testFigureNumbering();
};

void MarkdownAssemblerTest::testTwoColumnRow()
{
    Ocr::RawResult result;
    result.rawText = QStringLiteral(
        "<|ref|>text<|/ref|><|det|>[[0,0,400,100]]<|/det|>Left\n"
        "<|ref|>image<|/ref|><|det|>[[500,0,900,100]]<|/det|>");
    result.boxes = {
        {QStringLiteral("text"), Ocr::Box{0, 0, 400, 100}},
        {QStringLiteral("image"), Ocr::Box{500, 0, 900, 100}},
    };
    result.imageDims = {1000, 1000};

    MarkdownAssembler assembler;
    const QString markdown = assembler.assemble(result, {{1, QStringLiteral("img1")}});

    QCOMPARE(assembler.error(), MarkdownAssembler::NoError);
    QVERIFY(markdown.startsWith(QLatin1String("<table class=\"layout-table\"")));
    QVERIFY(markdown.contains(
        QLatin1String("<td width=\"50%\" style=\"border: none; vertical-align: top;\">Left</td>")));
    QVERIFY(markdown.contains(QLatin1String(
        "<td width=\"50%\" style=\"border: none; vertical-align: top;\">"
        "<img src=\"scan2doc-img:img1\" alt=\"Figure 1\" /></td>")));
    QVERIFY(markdown.endsWith(QLatin1String("</tr></table>")));
    QVERIFY(!markdown.contains(QLatin1String("## Figures")));
}

void MarkdownAssemblerTest::testLeadingTextKeepsColumns()
{
    Ocr::RawResult result;
    result.rawText = QStringLiteral(
        "Intro\n"
        "<|ref|>text<|/ref|><|det|>[[0,0,400,100]]<|/det|>Left\n"
        "<|ref|>text<|/ref|><|det|>[[500,0,900,100]]<|/det|>Right");
    result.boxes = {
        {QStringLiteral("text"), Ocr::Box{0, 0, 400, 100}},
        {QStringLiteral("text"), Ocr::Box{500, 0, 900, 100}},
    };
    result.imageDims = {1000, 1000};

    MarkdownAssembler assembler;
    const QString markdown = assembler.assemble(result, {});

    QVERIFY(markdown.startsWith(QLatin1String("Intro\n\n<table class=\"layout-table\"")));
    QVERIFY(markdown.contains(
        QLatin1String("<td width=\"50%\" style=\"border: none; vertical-align: top;\">Left</td>")));
    QVERIFY(markdown.contains(
        QLatin1String("<td width=\"50%\" style=\"border: none; vertical-align: top;\">Right</td>")));
    QCOMPARE(markdown.count(QLatin1String("Intro")), 1);
}

void MarkdownAssemblerTest::testGapTextVerbatim()
{
    Ocr::RawResult result;
    result.rawText = QStringLiteral(
        "Stray *emphasis* and a list:\n- one\n- two\n"
        "<|ref|>text<|/ref|><|det|>[[0,100,1000,200]]<|/det|>Body");
    result.boxes = {{QStringLiteral("text"), Ocr::Box{0, 100, 1000, 200}}};
    result.imageDims = {1000, 1000};

    MarkdownAssembler assembler;
    QCOMPARE(assembler.assemble(result, {}),
             QStringLiteral("Stray *emphasis* and a list:\n- one\n- two\n\nBody"));
}

void MarkdownAssemblerTest::testSingleBlocks()
{
    Ocr::RawResult result;
    result.rawText = QStringLiteral(
        "<|ref|>title<|/ref|><|det|>[[0,0,1000,50]]<|/det|># Heading\n"
        "<|ref|>text<|/ref|><|det|>[[0,100,1000,200]]<|/det|>Water boils at \\(100^{\\circ}\\)\n");
    result.imageDims = {1000, 1000};

    MarkdownAssembler assembler;
    QCOMPARE(assembler.assemble(result, {}),
             QStringLiteral("# Heading\n\nWater boils at $100^{\\circ}$"));
}

void MarkdownAssemblerTest::testNoMarkers()
{
    Ocr::RawResult result;
    result.rawText = QStringLiteral("  plain recognizer output \\(x\\)\n");

    MarkdownAssembler assembler;
    QCOMPARE(assembler.assemble(result, {}), result.rawText);
    QCOMPARE(assembler.error(), MarkdownAssembler::NoError);
}

void MarkdownAssemblerTest::testMissingRawText()
{
    MarkdownAssembler assembler;
    QVERIFY(assembler.assemble(Ocr::RawResult{}, {}).isNull());
    QCOMPARE(assembler.error(), MarkdownAssembler::MissingRawText);
}

void MarkdownAssemblerTest::testOrphanImages()
{
    Ocr::RawResult result;
    result.rawText = QStringLiteral("<|ref|>text<|/ref|><|det|>[[0,0,1000,100]]<|/det|>Body");
    result.boxes = {{QStringLiteral("text"), Ocr::Box{0, 0, 1000, 100}}};
    result.imageDims = {1000, 1000};

    MarkdownAssembler assembler;
    const QString markdown = assembler.assemble(
        result, {{3, QStringLiteral("late")}, {2, QStringLiteral("early")}});

    QCOMPARE(markdown, QStringLiteral("Body\n\n\n\n## Figures\n"
                                      "![Figure 1](scan2doc-img:early)\n"
                                      "![Figure 2](scan2doc-img:late)"));
}

void MarkdownAssemblerTest::testFigureNumbering()
{
    Ocr::RawResult result;
    result.rawText = QStringLiteral(
        "<|ref|>image<|/ref|><|det|>[[0,0,1000,100]]<|/det|>"
        "<|ref|>image<|/ref|><|det|>[[0,200,1000,300]]<|/det|>");
    result.boxes = {
        {QStringLiteral("image"), Ocr::Box{0, 0, 1000, 100}},
        {QStringLiteral("image"), Ocr::Box{0, 200, 1000, 300}},
    };
    result.imageDims = {1000, 1000};

    MarkdownAssembler assembler;
    const QMap<int, QString> images{{0, QStringLiteral("a")}, {1, QStringLiteral("b")}};
    const QString expected = QStringLiteral("![Figure 1](scan2doc-img:a)\n\n"
                                            "![Figure 2](scan2doc-img:b)");
    QCOMPARE(assembler.assemble(result, images), expected);
    // Numbering restarts per call.
    QCOMPARE(assembler.assemble(result, images), expected);
}

QTEST_GUILESS_MAIN(MarkdownAssemblerTest)
#include "markdownassemblertest.moc"
