/*
 * docxwritertest.cpp — OOXML parts and the zipped package
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "docxsynthesizer.h"
#include "docxwriter.h"
#include "latexmathml.h"

#include <KZip>

#include <QBuffer>

using namespace Docx;

namespace {

Paragraph textParagraph(const QString &text)
{
    Paragraph paragraph;
    paragraph.runs.append(TextRun{text});
    return paragraph;
}

ImageRun imageRun(const QString &id)
{
    return ImageRun{id, QByteArrayLiteral("png-bytes-") + id.toLatin1(), 600, 600};
}

} // anonymous namespace

class DocxWriterTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testParagraphProperties();
    void testTables();
    void testEmptyTableSkipped();
    void testImagesShareMedia();
    void testMath();
    void testStyles();
    void testRelationships();
    void testPackage();
    void testCodeAndNestedTableText();
};

void DocxWriterTest::testParagraphProperties()
{
    Document doc;
    Paragraph heading = textParagraph(QStringLiteral("Title"));
    heading.headingLevel = 2;
    heading.spacing = {240, 0, 360};
    doc.blocks.append(heading);

    Paragraph body = textParagraph(QStringLiteral("a < b"));
    body.firstLineIndent = 480;
    body.runs.append(BreakRun{});
    body.runs.append(TextRun{QStringLiteral("bold"), true, false});
    doc.blocks.append(body);

    QList<MediaPart> media;
    const QString xml = QString::fromUtf8(Writer::documentXml(doc, &media));

    QVERIFY(xml.contains(QLatin1String("<w:pStyle w:val=\"Heading2\"/>")));
    QVERIFY(xml.contains(QLatin1String(
        "<w:spacing w:before=\"240\" w:after=\"0\" w:line=\"360\" w:lineRule=\"auto\"/>")));
    QVERIFY(xml.contains(QLatin1String("<w:ind w:firstLine=\"480\"/>")));
    QVERIFY(xml.contains(QLatin1String("<w:t xml:space=\"preserve\">a &lt; b</w:t>")));
    QVERIFY(xml.contains(QLatin1String("<w:r><w:br/></w:r>")));
    QVERIFY(xml.contains(QLatin1String("<w:rPr><w:b/></w:rPr>")));
    QVERIFY(xml.contains(QLatin1String("<w:pgSz w:w=\"11906\" w:h=\"16838\"/>")));
    QVERIFY(media.isEmpty());
}

void DocxWriterTest::testTables()
{
    Table layout;
    layout.borderless = true;
    TableRow row;
    TableCell left;
    left.widthPercent = 50;
    left.paragraphs.append(textParagraph(QStringLiteral("Left")));
    TableCell right;
    right.widthPercent = 50;
    row.cells = {left, right};
    layout.rows.append(row);

    Table grid;
    TableRow gridRow;
    gridRow.cells = {TableCell(), TableCell()};
    grid.rows.append(gridRow);

    Document doc;
    doc.blocks = {layout, grid};

    QList<MediaPart> media;
    const QString xml = QString::fromUtf8(Writer::documentXml(doc, &media));

    QCOMPARE(xml.count(QLatin1String("<w:tbl>")), 2);
    QVERIFY(xml.contains(QLatin1String("<w:tblW w:w=\"5000\" w:type=\"pct\"/>")));
    QVERIFY(xml.contains(QLatin1String(
        "<w:top w:val=\"none\" w:sz=\"0\" w:space=\"0\" w:color=\"auto\"/>")));
    QVERIFY(xml.contains(QLatin1String(
        "<w:top w:val=\"single\" w:sz=\"1\" w:space=\"0\" w:color=\"auto\"/>")));
    QVERIFY(xml.contains(QLatin1String("<w:tcW w:w=\"2500\" w:type=\"pct\"/>")));
    QVERIFY(xml.contains(QLatin1String("<w:tcW w:w=\"0\" w:type=\"auto\"/>")));
    // 50% of the text width between 1 inch margins
    QVERIFY(xml.contains(QLatin1String("<w:gridCol w:w=\"4513\"/>")));
    // Empty cells get an empty paragraph.
    QVERIFY(xml.contains(QLatin1String("<w:p/></w:tc>")));
}

void DocxWriterTest::testEmptyTableSkipped()
{
    Document doc;
    doc.blocks.append(Table());
    QList<MediaPart> media;
    const QString xml = QString::fromUtf8(Writer::documentXml(doc, &media));
    QVERIFY(!xml.contains(QLatin1String("<w:tbl")));
}

void DocxWriterTest::testImagesShareMedia()
{
    Paragraph paragraph;
    paragraph.runs.append(imageRun(QStringLiteral("a")));
    paragraph.runs.append(imageRun(QStringLiteral("b")));
    paragraph.runs.append(imageRun(QStringLiteral("a")));
    Document doc;
    doc.blocks.append(paragraph);

    QList<MediaPart> media;
    const QString xml = QString::fromUtf8(Writer::documentXml(doc, &media));

    QCOMPARE(media.size(), 2);
    QCOMPARE(media[0].relationshipId, QStringLiteral("rId2"));
    QCOMPARE(media[0].target, QStringLiteral("media/image1.png"));
    QCOMPARE(media[1].relationshipId, QStringLiteral("rId3"));
    QCOMPARE(media[1].data, QByteArrayLiteral("png-bytes-b"));

    QCOMPARE(xml.count(QLatin1String("<w:drawing>")), 3);
    QCOMPARE(xml.count(QLatin1String("r:embed=\"rId2\"")), 2);
    // 600 px at 9525 EMU per pixel
    QVERIFY(xml.contains(QLatin1String("<wp:extent cx=\"5715000\" cy=\"5715000\"/>")));
}

void DocxWriterTest::testMath()
{
    Latex::MathMLConverter converter;
    MathRun math;
    QVERIFY(converter.parse(QStringLiteral("\\frac{1}{2}"), &math.math));
    math.display = true;

    Paragraph paragraph;
    paragraph.runs.append(math);
    Document doc;
    doc.blocks.append(paragraph);

    QList<MediaPart> media;
    const QString xml = QString::fromUtf8(Writer::documentXml(doc, &media));
    QVERIFY(xml.contains(QLatin1String("xmlns:m=\"http://schemas.openxmlformats.org/officeDocument/2006/math\"")));
    QVERIFY(xml.contains(QLatin1String("<w:p><m:oMathPara><m:oMath><m:f>")));
}

void DocxWriterTest::testStyles()
{
    const QString latin = QString::fromUtf8(Writer::stylesXml(false));
    QVERIFY(latin.contains(QLatin1String("w:ascii=\"Arial\"")));
    QVERIFY(!latin.contains(QLatin1String("<w:spacing")));
    QVERIFY(latin.contains(QLatin1String("w:styleId=\"Heading4\"")));
    QVERIFY(latin.contains(QLatin1String("<w:sz w:val=\"32\"/>")));

    const QString cjk = QString::fromUtf8(Writer::stylesXml(true));
    QVERIFY(cjk.contains(QLatin1String("w:eastAsia=\"Microsoft YaHei\"")));
    QVERIFY(cjk.contains(QLatin1String("<w:spacing w:val=\"20\"/>")));
}

void DocxWriterTest::testRelationships()
{
    const QString types = QString::fromUtf8(Writer::contentTypesXml());
    QVERIFY(types.contains(QLatin1String("Extension=\"png\"")));
    QVERIFY(types.contains(QLatin1String("PartName=\"/word/document.xml\"")));

    const QString package = QString::fromUtf8(Writer::packageRelsXml());
    QVERIFY(package.contains(QLatin1String("Target=\"word/document.xml\"")));

    MediaPart part;
    part.imageId = QStringLiteral("a");
    part.relationshipId = QStringLiteral("rId2");
    part.target = QStringLiteral("media/image1.png");
    const QString rels = QString::fromUtf8(Writer::documentRelsXml({part}));
    QVERIFY(rels.contains(QLatin1String("Id=\"rId1\"")));
    QVERIFY(rels.contains(QLatin1String("Target=\"styles.xml\"")));
    QVERIFY(rels.contains(QLatin1String("Id=\"rId2\"")));
    QVERIFY(rels.contains(QLatin1String("Target=\"media/image1.png\"")));
}

void DocxWriterTest::testPackage()
{
    Paragraph paragraph = textParagraph(QStringLiteral("hello"));
    paragraph.runs.append(imageRun(QStringLiteral("a")));
    Document doc;
    doc.blocks.append(paragraph);

    Writer writer;
    QByteArray bytes = writer.write(doc);
    QCOMPARE(writer.error(), Writer::NoError);
    QVERIFY(bytes.startsWith("PK"));

    QBuffer buffer(&bytes);
    KZip zip(&buffer);
    QVERIFY(zip.open(QIODevice::ReadOnly));
    const KArchiveDirectory *root = zip.directory();
    for (const char *name : {"[Content_Types].xml", "_rels/.rels", "word/document.xml",
                             "word/styles.xml", "word/_rels/document.xml.rels"}) {
        QVERIFY2(root->file(QLatin1String(name)), name);
    }
    const KArchiveFile *image = root->file(QStringLiteral("word/media/image1.png"));
    QVERIFY(image);
    QCOMPARE(image->data(), QByteArrayLiteral("png-bytes-a"));
    QVERIFY(root->file(QStringLiteral("word/document.xml"))->data().contains("hello"));
}

void DocxWriterTest::testCodeAndNestedTableText()
{
    Synthesizer synthesizer(nullptr);
    const Document doc = synthesizer.build(QStringLiteral(
        "```\nfenced_line();\n```\n\n"
        "<table class=\"layout-table\" border=\"0\"><tr>"
        "<td width=\"50%\"><table><tr><td>inner</td></tr></table></td>"
        "<td width=\"50%\">Right</td>"
        "</tr></table>"));

    Writer writer;
    QByteArray bytes = writer.write(doc);
    QCOMPARE(writer.error(), Writer::NoError);

    QBuffer buffer(&bytes);
    KZip zip(&buffer);
    QVERIFY(zip.open(QIODevice::ReadOnly));
    const KArchiveFile *document = zip.directory()->file(QStringLiteral("word/document.xml"));
    QVERIFY(document);
    const QByteArray xml = document->data();
    QVERIFY(xml.contains("fenced_line();"));
    QVERIFY(xml.contains("inner"));
    QVERIFY(xml.contains("Right"));
    QVERIFY(!xml.contains("&lt;table"));
}

QTEST_GUILESS_MAIN(DocxWriterTest)
#include "docxwritertest.moc"
