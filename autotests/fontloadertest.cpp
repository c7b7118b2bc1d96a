/*
 * fontloadertest.cpp — Font lookup, loading, shaping and subsetting
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "fontloader.h"
#include "fontmanager.h"
#include "pdffont.h"
#include "sfnt.h"
#include "textshaper.h"

#include <QFile>
#include <QTemporaryFile>
#include <QUrl>

class FontLoaderTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void testMissingSourceGivesUp();
    void testReadsLocalFileAndUrl();
    void testDefaultCjkSource();
    void testShapeAndSubset();
    void testToUnicodeCMap();

private:
    FontManager m_fontManager;
    QString m_latinFont;
};

void FontLoaderTest::initTestCase()
{
    QVERIFY(m_fontManager.isValid());
    for (const char *family : {"DejaVu Sans", "Liberation Sans", "Noto Sans", "sans-serif"}) {
        m_latinFont = m_fontManager.resolveFontPath(QLatin1String(family));
        if (!m_latinFont.isEmpty())
            break;
    }
}

void FontLoaderTest::testMissingSourceGivesUp()
{
    FontLoader::Settings settings;
    settings.retries = 3;
    settings.retryDelayMs = 0;
    FontLoader loader(&m_fontManager, settings);

    QVERIFY(loader.fetchFontBytes(QStringLiteral("/nonexistent/font.ttf")).isEmpty());
    QVERIFY(loader.fetchFontBytes(QString()).isEmpty());
    QVERIFY(loader.fetchFontBytes(QStringLiteral("/nonexistent/font.ttf"), 0).isEmpty());
}

void FontLoaderTest::testReadsLocalFileAndUrl()
{
    QTemporaryFile file;
    QVERIFY(file.open());
    file.write("not really a font");
    file.close();

    FontLoader::Settings settings;
    settings.retryDelayMs = 0;
    FontLoader loader(nullptr, settings);
    QCOMPARE(loader.fetchFontBytes(file.fileName()), QByteArrayLiteral("not really a font"));
    QCOMPARE(loader.fetchFontBytes(QUrl::fromLocalFile(file.fileName()).toString()),
             QByteArrayLiteral("not really a font"));

    // Served from the cache once read.
    const QString path = file.fileName();
    QVERIFY(QFile::remove(path));
    QCOMPARE(loader.fetchFontBytes(path), QByteArrayLiteral("not really a font"));
}

void FontLoaderTest::testDefaultCjkSource()
{
    FontLoader::Settings settings;
    settings.cjkFontPath = QStringLiteral("/opt/fonts/cjk.otf");
    QCOMPARE(FontLoader(nullptr, settings).defaultCjkSource(), settings.cjkFontPath);

    QVERIFY(FontLoader(nullptr).defaultCjkSource().isEmpty());
    QCOMPARE(FontLoader::cjkFamilies().first(), QStringLiteral("Noto Sans CJK SC"));
}

void FontLoaderTest::testShapeAndSubset()
{
    if (m_latinFont.isEmpty())
        QSKIP("no scalable font installed");

    FontFace *face = m_fontManager.loadFontFromPath(m_latinFont);
    QVERIFY(face);

    TextShaper shaper(&m_fontManager, face);
    const qreal narrow = shaper.textWidth(QStringLiteral("ii"), 12);
    const qreal wide = shaper.textWidth(QStringLiteral("WW"), 12);
    QVERIFY(narrow > 0);
    QVERIFY(wide > narrow);
    QVERIFY(qFuzzyCompare(shaper.textWidth(QStringLiteral("WW"), 24), wide * 2));

    face->usedGlyphs.clear();
    const QList<ShapedRun> runs = shaper.shape(QStringLiteral("Hello"), 12, true);
    QCOMPARE(runs.size(), 1);
    QCOMPARE(runs.first().glyphs.size(), 5);
    QCOMPARE(face->usedGlyphs.size(), 4);

    const sfnt::SubsetResult subset = sfnt::subsetFace(face->rawData, face->usedGlyphs.values(),
                                                       face->faceIndex);
    QVERIFY(subset.success);
    QVERIFY(!subset.fontData.isEmpty());
    QCOMPARE(subset.glyphCount, 5);
}

void FontLoaderTest::testToUnicodeCMap()
{
    const QByteArray cmap = Pdf::CidFont::buildToUnicodeCMap({{3, 0x48}, {7, 0x4E2D}});
    QVERIFY(cmap.contains("begincmap"));
    QVERIFY(cmap.contains("<0003> <0048>"));
    QVERIFY(cmap.contains("<0007> <4E2D>"));
}

QTEST_GUILESS_MAIN(FontLoaderTest)
#include "fontloadertest.moc"
