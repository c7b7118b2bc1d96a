/*
 * generatorsettingstest.cpp — scan2docrc reading and writing
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QTest>

#include "generatorsettings.h"

#include <KConfigGroup>
#include <QTemporaryDir>

class GeneratorSettingsTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testDefaults();
    void testReadsGroups();
    void testSharedTolerance();
    void testNonPositiveDpi();
    void testSaveRoundTrip();

private:
    QTemporaryDir m_dir;
};

void GeneratorSettingsTest::testDefaults()
{
    const GeneratorSettings s = GeneratorSettings::load(m_dir.filePath(QStringLiteral("empty.rc")));
    QCOMPARE(s.markdown.layout.columnOverlapRatio, 0.3);
    QCOMPARE(s.markdown.boxToleranceFraction, 0.05);
    QCOMPARE(s.markdown.defaultPageWidth, 1000);
    QCOMPARE(s.pdf.dpi, 150.0);
    QCOMPARE(s.pdf.fit.iterations, 12);
    QCOMPARE(s.docx.cjkRatioThreshold, 0.2);
    QCOMPARE(s.fonts.cjkFontFamily, QStringLiteral("Noto Sans CJK SC"));
    QCOMPARE(s.fonts.retries, 3);
}

void GeneratorSettingsTest::testReadsGroups()
{
    const QString path = m_dir.filePath(QStringLiteral("groups.rc"));
    {
        KSharedConfig::Ptr config = KSharedConfig::openConfig(path, KConfig::SimpleConfig);
        KConfigGroup(config, QStringLiteral("Layout")).writeEntry("CaptionMaxGapBelow", 40.0);
        KConfigGroup(config, QStringLiteral("Pdf")).writeEntry("Dpi", 300.0);
        KConfigGroup(config, QStringLiteral("Fonts")).writeEntry("CjkFontPath", QStringLiteral("/fonts/cjk.otf"));
        KConfigGroup(config, QStringLiteral("Docx")).writeEntry("CjkRatioThreshold", 0.5);
        config->sync();
    }

    const GeneratorSettings s = GeneratorSettings::load(path);
    QCOMPARE(s.markdown.layout.captionMaxGapBelow, 40.0);
    QCOMPARE(s.markdown.layout.captionMaxGapAbove, 10.0);
    QCOMPARE(s.pdf.dpi, 300.0);
    QCOMPARE(s.fonts.cjkFontPath, QStringLiteral("/fonts/cjk.otf"));
    QCOMPARE(s.docx.cjkRatioThreshold, 0.5);
}

void GeneratorSettingsTest::testSharedTolerance()
{
    const QString path = m_dir.filePath(QStringLiteral("tolerance.rc"));
    {
        KSharedConfig::Ptr config = KSharedConfig::openConfig(path, KConfig::SimpleConfig);
        KConfigGroup(config, QStringLiteral("BoxMatching")).writeEntry("ToleranceFraction", 0.1);
        config->sync();
    }

    const GeneratorSettings s = GeneratorSettings::load(path);
    QCOMPARE(s.markdown.boxToleranceFraction, 0.1);
    QCOMPARE(s.pdf.boxToleranceFraction, 0.1);
}

void GeneratorSettingsTest::testNonPositiveDpi()
{
    const QString path = m_dir.filePath(QStringLiteral("dpi.rc"));
    {
        KSharedConfig::Ptr config = KSharedConfig::openConfig(path, KConfig::SimpleConfig);
        KConfigGroup(config, QStringLiteral("Pdf")).writeEntry("Dpi", 0.0);
        config->sync();
    }

    QTest::ignoreMessage(QtWarningMsg, "GeneratorSettings: ignoring non-positive Dpi 0");
    const GeneratorSettings s = GeneratorSettings::load(path);
    QCOMPARE(s.pdf.dpi, 150.0);
}

void GeneratorSettingsTest::testSaveRoundTrip()
{
    const QString path = m_dir.filePath(QStringLiteral("saved.rc"));

    GeneratorSettings s;
    s.markdown.layout.columnOverlapRatio = 0.5;
    s.pdf.fit.maxFontSize = 72;
    s.fonts.retryDelayMs = 0;
    s.save(KSharedConfig::openConfig(path, KConfig::SimpleConfig));

    const GeneratorSettings loaded = GeneratorSettings::load(
        KSharedConfig::openConfig(path, KConfig::SimpleConfig));
    QCOMPARE(loaded.markdown.layout.columnOverlapRatio, 0.5);
    QCOMPARE(loaded.pdf.fit.maxFontSize, 72.0);
    QCOMPARE(loaded.fonts.retryDelayMs, 0);
    QCOMPARE(loaded.fonts.retries, 3);
}

QTEST_GUILESS_MAIN(GeneratorSettingsTest)
#include "generatorsettingstest.moc"
