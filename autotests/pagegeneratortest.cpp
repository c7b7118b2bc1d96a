/*
 * pagegeneratortest.cpp — End-to-end generation for a single page
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "imagestore.h"
#include "pagegenerator.h"

#include <QBuffer>
#include <QImage>

class PageGeneratorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testShouldGenerate();
    void testGenerateAll();
    void testCancelledBeforeStart();
    void testMissingRawText();
    void testUnsupportedImage();

private:
    static GeneratorSettings settings();
    static GenerationRequest request();
};

GeneratorSettings PageGeneratorTest::settings()
{
    GeneratorSettings s;
    s.fonts.retries = 1;
    s.fonts.retryDelayMs = 0;
    s.pdf.dpi = 72;
    return s;
}

GenerationRequest PageGeneratorTest::request()
{
    QImage page(400, 300, QImage::Format_RGB32);
    page.fill(Qt::white);
    QByteArray png;
    QBuffer buffer(&png);
    buffer.open(QIODevice::WriteOnly);
    page.save(&buffer, "PNG");

    GenerationRequest r;
    r.pageId = QStringLiteral("page-1");
    r.imageData = png;
    r.ocr.promptType = QStringLiteral("document");
    r.ocr.imageDims = {400, 300};
    r.ocr.rawText = QStringLiteral(
        "<|ref|>title<|/ref|><|det|>[[20, 10, 380, 40]]<|/det|>\n# Report\n"
        "<|ref|>text<|/ref|><|det|>[[20, 50, 380, 120]]<|/det|>\nPlain body text.\n"
        "<|ref|>image<|/ref|><|det|>[[20, 140, 200, 280]]<|/det|>\n");
    r.ocr.boxes = {
        {QStringLiteral("title"), Ocr::Box{20, 10, 380, 40}},
        {QStringLiteral("text"), Ocr::Box{20, 50, 380, 120}},
        {QStringLiteral("image"), Ocr::Box{20, 140, 200, 280}},
    };
    return r;
}

void PageGeneratorTest::testShouldGenerate()
{
    Ocr::RawResult result;
    result.promptType = QStringLiteral("document");
    QVERIFY(PageGenerator::shouldGenerate(result));
    result.promptType = QStringLiteral("free");
    QVERIFY(!PageGenerator::shouldGenerate(result));
}

void PageGeneratorTest::testGenerateAll()
{
    MemoryImageStore store;
    PageGenerator generator(&store, settings());

    GenerationResult result;
    QVERIFY2(generator.generateAll(request(), &result), qPrintable(generator.errorString()));
    QCOMPARE(generator.error(), PageGenerator::NoError);

    QCOMPARE(result.images.keys(), QList<int>{2});
    QCOMPARE(store.ids(), QStringList{result.images.value(2)});

    QVERIFY(result.markdown.startsWith(QLatin1String("# Report")));
    QVERIFY(result.markdown.contains(QLatin1String("Plain body text.")));
    QVERIFY(result.markdown.contains(QStringLiteral("scan2doc-img:") + result.images.value(2)));

    QVERIFY(result.docx.startsWith("PK"));
    QVERIFY(result.pdf.startsWith("%PDF"));
    QVERIFY(result.pdf.contains("/MediaBox [0 0 400.00 300.00]"));
}

void PageGeneratorTest::testCancelledBeforeStart()
{
    MemoryImageStore store;
    PageGenerator generator(&store, settings());
    const std::atomic<bool> cancel(true);

    GenerationResult result;
    QVERIFY(!generator.generateAll(request(), &result, &cancel));
    QCOMPARE(generator.error(), PageGenerator::Cancelled);
    QVERIFY(result.images.isEmpty());
    QVERIFY(store.ids().isEmpty());
    QVERIFY(result.pdf.isEmpty());
}

void PageGeneratorTest::testMissingRawText()
{
    MemoryImageStore store;
    PageGenerator generator(&store, settings());

    GenerationRequest r = request();
    r.ocr.rawText = QString();
    GenerationResult result;
    QVERIFY(!generator.generateAll(r, &result));
    QCOMPARE(generator.error(), PageGenerator::MissingRawText);
    QVERIFY(result.markdown.isEmpty());
}

void PageGeneratorTest::testUnsupportedImage()
{
    MemoryImageStore store;
    PageGenerator generator(&store, settings());

    GenerationRequest r = request();
    r.imageData = QByteArrayLiteral("not an image");
    GenerationResult result;
    QVERIFY(!generator.generateAll(r, &result));
    QCOMPARE(generator.error(), PageGenerator::UnsupportedImageFormat);
    QVERIFY(!result.markdown.isEmpty());
    QVERIFY(!result.docx.isEmpty());
    QVERIFY(result.images.isEmpty());
}

QTEST_GUILESS_MAIN(PageGeneratorTest)
#include "pagegeneratortest.moc"
