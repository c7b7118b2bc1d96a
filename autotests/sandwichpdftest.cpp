/*
 * sandwichpdftest.cpp — Text layer preparation and the sandwich PDF itself
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "sandwichpdfbuilder.h"
#include "standardfont.h"

#include <QBuffer>
#include <QImage>
#include <QRegularExpression>
#include <QtEndian>

namespace {

QByteArray encodedPage(const char *format, QImage::Format imageFormat = QImage::Format_RGB32)
{
    QImage page(300, 150, imageFormat);
    page.fill(Qt::white);
    QByteArray data;
    QBuffer buffer(&data);
    buffer.open(QIODevice::WriteOnly);
    page.save(&buffer, format);
    return data;
}

// Decoded content of every stream in pdf, inflating FlateDecode ones.
QList<QByteArray> pdfStreams(const QByteArray &pdf)
{
    static const QByteArray streamStart = ">>\nstream\n";
    QList<QByteArray> streams;
    qsizetype pos = pdf.indexOf(streamStart);
    while (pos != -1) {
        const qsizetype dictStart = pdf.lastIndexOf("obj\n", pos);
        const QByteArray dict = pdf.mid(dictStart, pos - dictStart);
        const qsizetype lengthAt = dict.indexOf("/Length ");
        const qsizetype lengthEnd = dict.indexOf('\n', lengthAt);
        const int length = dict.mid(lengthAt + 8, lengthEnd - lengthAt - 8).toInt();
        QByteArray data = pdf.mid(pos + streamStart.size(), length);
        if (dict.contains("/FlateDecode")) {
            // qUncompress wants a big-endian size hint in front of the zlib data.
            QByteArray hint(4, '\0');
            qToBigEndian<quint32>(1 << 20, hint.data());
            data = qUncompress(hint + data);
        }
        streams.append(data);
        pos = pdf.indexOf(streamStart, pos + streamStart.size() + length);
    }
    return streams;
}

Ocr::ParsedBlock block(const QString &type, const QString &content)
{
    Ocr::ParsedBlock b;
    b.type = type;
    b.content = content;
    return b;
}

} // anonymous namespace

class SandwichPdfTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testRepairTableBlocks();
    void testRepairLeavesFilledTables();
    void testCleanTableHtml();
    void testCleanText();
    void testRemoveMarkdownLinks();
    void testBlockText();
    void testStandardFontWidths();
    void testStandardFontEncoding();
    void testUnsupportedImage();
    void testPngPage();
    void testPageWithoutText();
    void testJpegPassthrough();
    void testJpegComponents();
    void testCmykJpegReencoded();
};

void SandwichPdfTest::testRepairTableBlocks()
{
    QList<Ocr::ParsedBlock> blocks{
        block(QStringLiteral("table"), QString()),
        block(QStringLiteral("text"), QStringLiteral("<table><tr><td>x</td></tr></table> tail")),
    };
    SandwichPdfBuilder::repairTableBlocks(blocks);

    QCOMPARE(blocks[0].content, QStringLiteral("<table><tr><td>x</td></tr></table>"));
    QCOMPARE(blocks[1].content, QStringLiteral("tail"));
}

void SandwichPdfTest::testRepairLeavesFilledTables()
{
    QList<Ocr::ParsedBlock> blocks{
        block(QStringLiteral("table"), QStringLiteral("<table><tr><td>a</td></tr></table>")),
        block(QStringLiteral("text"), QStringLiteral("<table><tr><td>b</td></tr></table>")),
        block(QStringLiteral("table"), QString()),
        block(QStringLiteral("text"), QStringLiteral("no markup")),
    };
    const QList<Ocr::ParsedBlock> before = blocks;
    SandwichPdfBuilder::repairTableBlocks(blocks);
    for (int i = 0; i < blocks.size(); ++i)
        QCOMPARE(blocks[i].content, before[i].content);
}

void SandwichPdfTest::testCleanTableHtml()
{
    QCOMPARE(SandwichPdfBuilder::cleanTableHtml(QStringLiteral(
                 "<table><tr><td>a</td><td>b &amp; c<br/>d</td></tr>"
                 "<tr><th>&lt;e&gt;</th></tr></table>")),
             QStringLiteral("a  b & c d\n<e>"));
}

void SandwichPdfTest::testCleanText()
{
    QCOMPARE(SandwichPdfBuilder::cleanText(QStringLiteral(
                 "## Heading with \\(x^{2}\\) and ![Figure 1](scan2doc-img:a) [link](http://x)")),
             QStringLiteral("Heading with x² and"));
    QCOMPARE(SandwichPdfBuilder::cleanText(QStringLiteral("Boils at $100^{\\circ}\\mathrm{C}$.")),
             QStringLiteral("Boils at 100°C."));
    QCOMPARE(SandwichPdfBuilder::cleanText(QStringLiteral("$$a \\times b$$\nnext")),
             QStringLiteral("a × b next"));
    QCOMPARE(SandwichPdfBuilder::cleanText(QStringLiteral("Costs $5 and $6 today")),
             QStringLiteral("Costs $5 and $6 today"));
    QCOMPARE(SandwichPdfBuilder::cleanText(QStringLiteral("Area $x^{2}$ and $5")),
             QStringLiteral("Area x² and $5"));
}

void SandwichPdfTest::testRemoveMarkdownLinks()
{
    QCOMPARE(SandwichPdfBuilder::removeMarkdownLinks(QStringLiteral("a [b] c [d](e) f"), false),
             QStringLiteral("a [b] c  f"));
    QCOMPARE(SandwichPdfBuilder::removeMarkdownLinks(QStringLiteral("x ![y](z) [w](v)"), true),
             QStringLiteral("x  [w](v)"));
    QCOMPARE(SandwichPdfBuilder::removeMarkdownLinks(QStringLiteral("open [a](b"), false),
             QStringLiteral("open [a](b"));
}

void SandwichPdfTest::testBlockText()
{
    QCOMPARE(SandwichPdfBuilder::blockText(
                 block(QStringLiteral("table"), QStringLiteral("<tr><td>1</td><td>2</td></tr>"))),
             QStringLiteral("1  2"));
    QCOMPARE(SandwichPdfBuilder::blockText(block(QStringLiteral("text"), QStringLiteral("# T"))),
             QStringLiteral("T"));
}

void SandwichPdfTest::testStandardFontWidths()
{
    Pdf::StandardFont font;
    QCOMPARE(font.textWidth(QStringLiteral("A"), 10), 6.67);
    QCOMPARE(font.textWidth(QStringLiteral("Hi"), 1000), 944.0);
    // Unencodable characters measure as '?'.
    QCOMPARE(font.textWidth(QStringLiteral("中"), 1000), 556.0);
    QCOMPARE(Pdf::StandardFont::glyphWidth(' '), 278);
}

void SandwichPdfTest::testStandardFontEncoding()
{
    QCOMPARE(Pdf::StandardFont::winAnsiCode(QChar(0x20AC)), uchar(128));
    QCOMPARE(Pdf::StandardFont::winAnsiCode(QChar(0x00E9)), uchar(0xE9));
    QCOMPARE(Pdf::StandardFont::winAnsiCode(QChar(0x4E2D)), uchar(0));

    Pdf::StandardFont font;
    QByteArray operand;
    QVERIFY(font.encode(QStringLiteral("(a)"), 10, &operand));
    QCOMPARE(operand, QByteArrayLiteral("(\\(a\\))"));
    QVERIFY(!font.encode(QStringLiteral("中文"), 10, &operand));
}

void SandwichPdfTest::testUnsupportedImage()
{
    Ocr::RawResult result;
    result.rawText = QStringLiteral("text");

    SandwichPdfBuilder builder(nullptr, nullptr);
    QVERIFY(builder.build(QByteArrayLiteral("GIF89a not really"), result).isEmpty());
    QCOMPARE(builder.error(), SandwichPdfBuilder::UnsupportedImageFormat);
    QVERIFY(builder.errorString().contains(QLatin1String("JPEG and PNG")));
}

void SandwichPdfTest::testPngPage()
{
    Ocr::RawResult result;
    result.rawText = QStringLiteral(
        "<|ref|>text<|/ref|><|det|>[[10,10,290,60]]<|/det|>Hello world\n"
        "<|ref|>image<|/ref|><|det|>[[10,70,290,140]]<|/det|>");
    result.boxes = {{QStringLiteral("text"), Ocr::Box{10, 10, 290, 60}}};
    result.imageDims = {300, 150};

    SandwichPdfBuilder builder(nullptr, nullptr);
    const QByteArray pdf = builder.build(encodedPage("PNG"), result);

    QCOMPARE(builder.error(), SandwichPdfBuilder::NoError);
    QCOMPARE(builder.fontName(), QStringLiteral("Helvetica"));
    QVERIFY(pdf.startsWith("%PDF-"));
    QVERIFY(pdf.trimmed().endsWith("%%EOF"));
    // 300x150 px at 150 dpi
    QVERIFY(pdf.contains("/MediaBox [0 0 144.00 72.00]"));
    QVERIFY(pdf.contains("/BaseFont /Helvetica"));
    QVERIFY(pdf.contains("/ExtGState"));
    QVERIFY(pdf.contains("/ca 0 /CA 0"));
    QVERIFY(pdf.contains("/ColorSpace /DeviceRGB"));
    QVERIFY(!pdf.contains("/DCTDecode"));

    QByteArray content;
    for (const QByteArray &stream : pdfStreams(pdf)) {
        if (stream.contains("3 Tr"))
            content = stream;
    }
    QVERIFY(!content.isEmpty());
    QVERIFY(content.contains("/GS0 gs"));
    QVERIFY(content.contains("(Hello world) Tj") || content.contains("(Hello) Tj"));

    // Scale 0.48 pt/px: the box starts at x 4.80, and the first baseline
    // sits one font size below its flipped top, raised by a tenth.
    static const QRegularExpression fontRe(QStringLiteral("/F0 ([0-9.]+) Tf"));
    const QRegularExpressionMatch fontMatch = fontRe.match(QString::fromLatin1(content));
    QVERIFY(fontMatch.hasMatch());
    const qreal fontSize = fontMatch.captured(1).toDouble();
    QVERIFY(fontSize > 0);
    const qreal baseline = 72.0 - 10 * 0.48 - fontSize + 0.1 * fontSize;
    static const QRegularExpression matrixRe(QStringLiteral("1 0 0 1 4\\.80 ([0-9.]+) Tm"));
    const QRegularExpressionMatch matrixMatch = matrixRe.match(QString::fromLatin1(content));
    QVERIFY(matrixMatch.hasMatch());
    QVERIFY(qAbs(matrixMatch.captured(1).toDouble() - baseline) < 0.02);
}

void SandwichPdfTest::testPageWithoutText()
{
    SandwichPdfBuilder builder(nullptr, nullptr);
    const QByteArray pdf = builder.build(encodedPage("PNG"), Ocr::RawResult{});

    QCOMPARE(builder.error(), SandwichPdfBuilder::NoError);
    QVERIFY(pdf.startsWith("%PDF-"));
    QVERIFY(!pdf.contains("/Font"));
    QVERIFY(!pdf.contains("/ExtGState"));
}

void SandwichPdfTest::testJpegPassthrough()
{
    const QByteArray jpeg = encodedPage("JPEG");
    if (jpeg.isEmpty())
        QSKIP("no JPEG image plugin available");

    Ocr::RawResult result;
    result.rawText = QStringLiteral("<|ref|>text<|/ref|><|det|>[[10,10,290,60]]<|/det|>Hi");
    SandwichPdfBuilder builder(nullptr, nullptr);
    const QByteArray pdf = builder.build(jpeg, result);

    QCOMPARE(builder.error(), SandwichPdfBuilder::NoError);
    QVERIFY(pdf.contains("/Filter /DCTDecode"));
    QVERIFY(pdf.contains(jpeg));
    QVERIFY(pdf.contains("/ColorSpace /DeviceRGB"));
}

void SandwichPdfTest::testJpegComponents()
{
    // SOI, an APP0 segment, then a baseline frame header with four components
    const QByteArray cmyk = QByteArray::fromHex(
        "ffd8" "ffe00006" "4a4649" "4600"
        "ffc00014" "08" "0096" "012c" "04" "011100" "021100" "031100" "041100");
    QCOMPARE(SandwichPdfBuilder::jpegComponents(cmyk), 4);
    QCOMPARE(SandwichPdfBuilder::jpegComponents(QByteArrayLiteral("\x89PNG")), 0);
    QCOMPARE(SandwichPdfBuilder::jpegComponents(QByteArray::fromHex("ffd8ffda0002")), 0);

    const QByteArray rgb = encodedPage("JPEG");
    if (rgb.isEmpty())
        QSKIP("no JPEG image plugin available");
    QCOMPARE(SandwichPdfBuilder::jpegComponents(rgb), 3);
    QCOMPARE(SandwichPdfBuilder::jpegComponents(encodedPage("JPEG", QImage::Format_Grayscale8)), 1);
}

void SandwichPdfTest::testCmykJpegReencoded()
{
#if QT_VERSION >= QT_VERSION_CHECK(6, 8, 0)
    const QByteArray jpeg = encodedPage("JPEG", QImage::Format_CMYK8888);
    if (jpeg.isEmpty() || SandwichPdfBuilder::jpegComponents(jpeg) != 4)
        QSKIP("JPEG plugin cannot write CMYK");

    SandwichPdfBuilder builder(nullptr, nullptr);
    const QByteArray pdf = builder.build(jpeg, Ocr::RawResult{});

    QCOMPARE(builder.error(), SandwichPdfBuilder::NoError);
    QVERIFY(!pdf.contains("/DCTDecode"));
    QVERIFY(pdf.contains("/ColorSpace /DeviceRGB"));
#else
    QSKIP("CMYK images need Qt 6.8");
#endif
}

QTEST_GUILESS_MAIN(SandwichPdfTest)
#include "sandwichpdftest.moc"
