/*
 * docxsynthesizertest.cpp — Markdown to DOCX object graph
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "docxsynthesizer.h"
#include "imagestore.h"

using namespace Docx;

namespace {

QString runText(const Run &run)
{
    if (const auto *text = std::get_if<TextRun>(&run))
        return text->text;
    return {};
}

QString paragraphText(const Paragraph &paragraph)
{
    QString text;
    for (const Run &run : paragraph.runs)
        text += runText(run);
    return text;
}

} // anonymous namespace

class DocxSynthesizerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void testHeadingsAndBody();
    void testHeadingLevelClamped();
    void testCjkDocument();
    void testCjkRatio();
    void testLayoutTable();
    void testHeaderCellsBold();
    void testTableWithoutRows();
    void testImageParagraph();
    void testMissingImages();
    void testInlineFormatting();
    void testLineBreaks();
    void testTightList();
    void testDisplayMath();
    void testMathFallback();
    void testCellMarkdown();
    void testNestedTable();
    void testCodeBlock();

private:
    MemoryImageStore m_store;
};

void DocxSynthesizerTest::initTestCase()
{
    ExtractedImage image;
    image.id = QStringLiteral("img1");
    image.pageId = QStringLiteral("page");
    image.pngData = QByteArrayLiteral("\x89PNG fake");
    QVERIFY(m_store.save(image));
}

void DocxSynthesizerTest::testHeadingsAndBody()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral("# Title\n\nBody text"));

    QVERIFY(!doc.cjk);
    QCOMPARE(doc.blocks.size(), 2);

    const Paragraph heading = std::get<Paragraph>(doc.blocks[0]);
    QCOMPARE(heading.headingLevel, 1);
    QCOMPARE(paragraphText(heading), QStringLiteral("Title"));
    QCOMPARE(heading.spacing.before, 240);
    QCOMPARE(heading.spacing.after, 240);
    QCOMPARE(heading.spacing.line, 360);

    const Paragraph body = std::get<Paragraph>(doc.blocks[1]);
    QCOMPARE(body.headingLevel, 0);
    QCOMPARE(paragraphText(body), QStringLiteral("Body text"));
    QCOMPARE(body.spacing.before, -1);
    QCOMPARE(body.spacing.after, 240);
    QCOMPARE(body.spacing.line, 360);
    QCOMPARE(body.firstLineIndent, 0);
}

void DocxSynthesizerTest::testHeadingLevelClamped()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral("###### Deep"));
    QCOMPARE(doc.blocks.size(), 1);
    QCOMPARE(std::get<Paragraph>(doc.blocks[0]).headingLevel, 4);
}

void DocxSynthesizerTest::testCjkDocument()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral("# 标题\n\n这是一个中文段落。"));

    QVERIFY(doc.cjk);
    QCOMPARE(doc.blocks.size(), 2);
    const Paragraph heading = std::get<Paragraph>(doc.blocks[0]);
    QCOMPARE(heading.spacing.after, 0);
    const Paragraph body = std::get<Paragraph>(doc.blocks[1]);
    QCOMPARE(body.firstLineIndent, 480);
    QCOMPARE(body.spacing.after, 0);
}

void DocxSynthesizerTest::testCjkRatio()
{
    QCOMPARE(Synthesizer::cjkRatio(QString()), 0.0);
    QCOMPARE(Synthesizer::cjkRatio(QStringLiteral("这是abc")), 0.4);
    // Markup and links do not count.
    QCOMPARE(Synthesizer::cjkRatio(QStringLiteral("## 中 ![x](scan2doc-img:abc)")), 1.0);
    // So are HTML tags.
    QCOMPARE(Synthesizer::cjkRatio(QStringLiteral(
                 "<table class=\"layout-table\"><tr><td width=\"50%\">中文</td></tr></table>")),
             1.0);
}

void DocxSynthesizerTest::testLayoutTable()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral(
        "<table class=\"layout-table\" border=\"0\"><tr>"
        "<td width=\"50%\" style=\"border: none;\">Left</td>"
        "<td width=\"50%\" style=\"border: none;\">"
        "<img src=\"scan2doc-img:img1\" alt=\"Figure 1\" /></td>"
        "</tr></table>\n\nAfter"));

    QCOMPARE(doc.blocks.size(), 2);
    const Table table = std::get<Table>(doc.blocks[0]);
    QVERIFY(table.borderless);
    QCOMPARE(table.rows.size(), 1);
    QCOMPARE(table.rows[0].cells.size(), 2);
    QCOMPARE(table.rows[0].cells[0].widthPercent, 50);
    QCOMPARE(paragraphText(table.rows[0].cells[0].paragraphs.first()), QStringLiteral("Left"));

    const Paragraph imageCell = table.rows[0].cells[1].paragraphs.first();
    QCOMPARE(imageCell.runs.size(), 1);
    const auto *image = std::get_if<ImageRun>(&imageCell.runs.first());
    QVERIFY(image);
    QCOMPARE(image->imageId, QStringLiteral("img1"));
    QCOMPARE(image->width, 100);

    const Paragraph after = std::get<Paragraph>(doc.blocks[1]);
    QCOMPARE(after.spacing.before, 360);
}

void DocxSynthesizerTest::testHeaderCellsBold()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral(
        "<table><tr><th>Name</th><th></th></tr><tr><td>value</td><td>2</td></tr></table>"));

    QCOMPARE(doc.blocks.size(), 1);
    const Table table = std::get<Table>(doc.blocks[0]);
    QVERIFY(!table.borderless);
    QCOMPARE(table.rows.size(), 2);

    const auto *header = std::get_if<TextRun>(&table.rows[0].cells[0].paragraphs.first().runs.first());
    QVERIFY(header);
    QVERIFY(header->bold);
    // Empty cells still carry a paragraph.
    QCOMPARE(table.rows[0].cells[1].paragraphs.size(), 1);

    const auto *data = std::get_if<TextRun>(&table.rows[1].cells[0].paragraphs.first().runs.first());
    QVERIFY(data);
    QVERIFY(!data->bold);
}

void DocxSynthesizerTest::testTableWithoutRows()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral("<table></table>\n\ntext"));
    QCOMPARE(doc.blocks.size(), 1);
    QVERIFY(std::holds_alternative<Paragraph>(doc.blocks[0]));
    QCOMPARE(std::get<Paragraph>(doc.blocks[0]).spacing.before, -1);
}

void DocxSynthesizerTest::testImageParagraph()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral("![Figure 1](scan2doc-img:img1)"));

    QCOMPARE(doc.blocks.size(), 1);
    const Paragraph paragraph = std::get<Paragraph>(doc.blocks[0]);
    const auto *image = std::get_if<ImageRun>(&paragraph.runs.first());
    QVERIFY(image);
    QCOMPARE(image->width, 600);
    QCOMPARE(image->height, 600);
    QCOMPARE(image->pngData, QByteArrayLiteral("\x89PNG fake"));
}

void DocxSynthesizerTest::testMissingImages()
{
    Synthesizer synthesizer(&m_store);
    QVERIFY(synthesizer.build(QStringLiteral("![Figure 1](scan2doc-img:nope)")).blocks.isEmpty());
    QVERIFY(synthesizer.build(QStringLiteral("![Figure 1](figure.png)")).blocks.isEmpty());

    const Document doc = synthesizer.build(QStringLiteral(
        "see ![a](scan2doc-img:nope) and ![b](figure.png) here"));
    QCOMPARE(doc.blocks.size(), 1);
    QCOMPARE(paragraphText(std::get<Paragraph>(doc.blocks[0])),
             QStringLiteral("see [Missing Image] and [Missing Image ID] here"));

    Synthesizer withoutStore(nullptr);
    QVERIFY(withoutStore.build(QStringLiteral("![x](scan2doc-img:img1)")).blocks.isEmpty());
}

void DocxSynthesizerTest::testInlineFormatting()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral("plain **bold** *italic* &amp;"));
    const Paragraph paragraph = std::get<Paragraph>(doc.blocks[0]);

    QCOMPARE(paragraph.runs.size(), 5);
    const auto *bold = std::get_if<TextRun>(&paragraph.runs[1]);
    QVERIFY(bold && bold->bold && !bold->italic);
    QCOMPARE(bold->text, QStringLiteral("bold"));
    const auto *italic = std::get_if<TextRun>(&paragraph.runs[3]);
    QVERIFY(italic && italic->italic);
    QCOMPARE(runText(paragraph.runs[4]), QStringLiteral(" &"));
}

void DocxSynthesizerTest::testLineBreaks()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral("line one<br>line two"));
    const Paragraph paragraph = std::get<Paragraph>(doc.blocks[0]);

    QCOMPARE(paragraph.runs.size(), 3);
    QVERIFY(std::holds_alternative<BreakRun>(paragraph.runs[1]));
    QCOMPARE(runText(paragraph.runs[2]), QStringLiteral("line two"));
}

void DocxSynthesizerTest::testTightList()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral("- one\n- two"));
    QCOMPARE(doc.blocks.size(), 2);
    QCOMPARE(paragraphText(std::get<Paragraph>(doc.blocks[0])), QStringLiteral("one"));
    QCOMPARE(paragraphText(std::get<Paragraph>(doc.blocks[1])), QStringLiteral("two"));
}

void DocxSynthesizerTest::testDisplayMath()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral("$$E=mc^2$$"));

    QCOMPARE(doc.blocks.size(), 1);
    const Paragraph paragraph = std::get<Paragraph>(doc.blocks[0]);
    QCOMPARE(paragraph.runs.size(), 1);
    const auto *math = std::get_if<MathRun>(&paragraph.runs.first());
    QVERIFY(math);
    QVERIFY(math->display);
    QCOMPARE(math->latex, QStringLiteral("E=mc^2"));
    QCOMPARE(paragraph.spacing.before, 240);
    QCOMPARE(paragraph.spacing.after, 240);
    QCOMPARE(paragraph.spacing.line, 360);

    const Document inlineDoc = synthesizer.build(QStringLiteral("Energy $E=mc^2$ holds"));
    const Paragraph body = std::get<Paragraph>(inlineDoc.blocks[0]);
    QCOMPARE(body.runs.size(), 3);
    const auto *inlineMath = std::get_if<MathRun>(&body.runs[1]);
    QVERIFY(inlineMath);
    QVERIFY(!inlineMath->display);
}

void DocxSynthesizerTest::testMathFallback()
{
    const Run ok = Synthesizer::mathRun(QStringLiteral("x^2"), false);
    QVERIFY(std::holds_alternative<MathRun>(ok));

    const Run failed = Synthesizer::mathRun(QStringLiteral("\\frac{a"), true);
    QVERIFY(std::holds_alternative<TextRun>(failed));
    QCOMPARE(runText(failed), QStringLiteral("\\frac{a"));
}

void DocxSynthesizerTest::testCellMarkdown()
{
    QCOMPARE(Synthesizer::cellMarkdown(QStringLiteral(
                 "<center><img src=\"scan2doc-img:a_1\" alt=\"Figure 2\" /></center>"
                 "<br/>caption")),
             QStringLiteral("![Figure 2](scan2doc-img:a_1)\n\ncaption"));
    QCOMPARE(Synthesizer::cellMarkdown(QStringLiteral("<img src=\"scan2doc-img:b\">")),
             QStringLiteral("![Figure](scan2doc-img:b)"));
}

void DocxSynthesizerTest::testNestedTable()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral(
        "<table class=\"layout-table\" border=\"0\"><tr>"
        "<td width=\"50%\"><table><tr><td>x</td></tr></table></td>"
        "<td width=\"50%\">Right</td>"
        "</tr></table>"));

    QCOMPARE(doc.blocks.size(), 1);
    const Table table = std::get<Table>(doc.blocks[0]);
    QCOMPARE(table.rows.size(), 1);
    QCOMPARE(table.rows[0].cells.size(), 2);
    QCOMPARE(table.rows[0].cells[0].paragraphs.size(), 1);
    QCOMPARE(paragraphText(table.rows[0].cells[0].paragraphs[0]).trimmed(), QStringLiteral("x"));
    QCOMPARE(table.rows[0].cells[1].paragraphs.size(), 1);
    QCOMPARE(paragraphText(table.rows[0].cells[1].paragraphs[0]), QStringLiteral("Right"));
}

void DocxSynthesizerTest::testCodeBlock()
{
    Synthesizer synthesizer(&m_store);
    const Document doc = synthesizer.build(QStringLiteral(
        "```\nint x = 1;\nreturn x;\n```\n\nAfter\n\n    indented line\n"));

    QCOMPARE(doc.blocks.size(), 4);
    QCOMPARE(paragraphText(std::get<Paragraph>(doc.blocks[0])), QStringLiteral("int x = 1;"));
    QCOMPARE(paragraphText(std::get<Paragraph>(doc.blocks[1])), QStringLiteral("return x;"));
    QCOMPARE(paragraphText(std::get<Paragraph>(doc.blocks[2])), QStringLiteral("After"));
    QCOMPARE(paragraphText(std::get<Paragraph>(doc.blocks[3])), QStringLiteral("indented line"));
}

QTEST_GUILESS_MAIN(DocxSynthesizerTest)
#include "docxsynthesizertest.moc"
